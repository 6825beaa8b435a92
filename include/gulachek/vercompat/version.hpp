#ifndef GULACHEK_VERCOMPAT_VERSION_HPP
#define GULACHEK_VERCOMPAT_VERSION_HPP

#include <compare>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace gulachek::vercompat
{
	// one separator-delimited piece of a version string
	class VERCOMPAT_API segment
	{
		public:
			// declaration order is the rank used to break ties between kinds
			enum class kind
			{
				min,
				tag,
				number,
				build,
				max
			};

			segment(kind k = kind::tag, std::string value = {});

			static segment number(std::string_view digits);
			static segment tag(std::string_view text);
			static segment build(std::string_view text);

			kind type() const;
			const std::string& value() const;

			bool is_number() const;

			// equivalent to the absence of a segment (0, "", "final", ...)
			bool is_empty() const;

			// -1, 0 or 1 when compared against the absence of a segment
			int compare_to_empty() const;

			// qualifier level of a tag, 0 for non-tags
			int level() const;

			std::string repr() const;

			std::weak_ordering operator <=> (const segment &rhs) const;
			bool operator == (const segment &rhs) const;

		private:
			kind kind_;
			std::string value_;
	};

	class VERCOMPAT_API version
	{
		public:
			version(std::string_view repr = {});

			const std::string& repr() const;
			const std::vector<segment>& segments() const;

			// equivalent versions may still differ structurally (1.0 vs 1.0.0)
			std::weak_ordering operator <=> (const version &rhs) const;

			// structural equality of segments
			bool operator == (const version &rhs) const;

		private:
			std::string repr_;
			std::vector<segment> segments_;
	};

	VERCOMPAT_API std::ostream& operator << (std::ostream &os, const segment &s);
	VERCOMPAT_API std::ostream& operator << (std::ostream &os, const version &v);
}

#endif
