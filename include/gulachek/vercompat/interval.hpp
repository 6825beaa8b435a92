#ifndef GULACHEK_VERCOMPAT_INTERVAL_HPP
#define GULACHEK_VERCOMPAT_INTERVAL_HPP

#include "gulachek/vercompat/version.hpp"

#include <optional>
#include <ostream>

namespace gulachek::vercompat
{
	// range of versions with optionally open or missing bounds
	class VERCOMPAT_API version_interval
	{
		public:
			version_interval(
					std::optional<version> from = std::nullopt,
					std::optional<version> to = std::nullopt,
					bool from_included = false,
					bool to_included = false
					);

			// sentinel meaning "no range was given", not an empty range
			static version_interval zero();

			const std::optional<version>& from() const;
			const std::optional<version>& to() const;
			bool from_included() const;
			bool to_included() const;

			bool is_zero() const;
			bool contains(const version &v) const;

			bool operator == (const version_interval &rhs) const;

		private:
			std::optional<version> from_;
			std::optional<version> to_;
			bool from_included_;
			bool to_included_;
	};

	VERCOMPAT_API std::ostream& operator << (std::ostream &os, const version_interval &i);
}

#endif
