#ifndef GULACHEK_VERCOMPAT_CONSTRAINT_HPP
#define GULACHEK_VERCOMPAT_CONSTRAINT_HPP

#include "gulachek/vercompat/version.hpp"
#include "gulachek/vercompat/interval.hpp"

#include <gulachek/error.hpp>

#include <ostream>
#include <string_view>
#include <vector>

namespace gulachek::vercompat
{
	// user shouldn't care about specific reason
	// this is useful for testing code paths were hit
	enum class constraint_error_code
	{
		success,
		unterminated_interval,
		too_many_bounds,
		missing_version,
		exact_not_inclusive,
		inverted_interval
	};

	/**
	 * Either a set of preferred versions or a range. When the interval
	 * is not zero, the preferred set is ignored.
	 */
	class VERCOMPAT_API version_constraint
	{
		public:
			version_constraint(
					std::vector<version> preferred = {},
					version_interval interval = version_interval::zero()
					);

			static version_constraint from_version(version v);
			static version_constraint from_interval(version_interval i);

			/**
			 * Parse a constraint string
			 *
			 * Accepted forms are intervals ("[1.0,2.0)", "(,1.5]", "[1.2]"),
			 * prefixes ("1.2.+", "1.2+") and plain preferred versions.
			 * On error, *out is left as the empty constraint.
			 */
			static error parse(std::string_view sv, version_constraint *out);

			const std::vector<version>& preferred() const;
			const version_interval& interval() const;

			// matches nothing
			bool is_empty() const;

			bool operator == (const version_constraint &rhs) const;

		private:
			std::vector<version> preferred_;
			version_interval interval_;
	};

	VERCOMPAT_API std::ostream& operator << (std::ostream &os, const version_constraint &c);
}

#endif
