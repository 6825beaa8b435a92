#include "gulachek/vercompat/version.hpp"

#include <algorithm>
#include <utility>

namespace gulachek::vercompat
{
	static bool is_digit(char c)
	{ return c >= '0' && c <= '9'; }

	static bool is_separator(char c)
	{ return c == '.' || c == '-' || c == '_'; }

	static char lower(char c)
	{
		if (c >= 'A' && c <= 'Z')
			return c - 'A' + 'a';

		return c;
	}

	static std::string to_lower(std::string_view sv)
	{
		std::string out{sv};
		std::transform(out.begin(), out.end(), out.begin(), lower);
		return out;
	}

	// numbers are kept without leading zeros so length orders them
	static std::string strip_zeros(std::string digits)
	{
		auto first = digits.find_first_not_of('0');
		if (first == std::string::npos)
			return "0";

		return digits.substr(first);
	}

	segment::segment(kind k, std::string value) :
		kind_{k},
		value_{k == kind::number ? strip_zeros(std::move(value)) : std::move(value)}
	{}

	segment segment::number(std::string_view digits)
	{ return {kind::number, std::string{digits}}; }

	segment segment::tag(std::string_view text)
	{
		auto word = to_lower(text);
		if (word == "min")
			return {kind::min, {}};

		if (word == "max")
			return {kind::max, {}};

		return {kind::tag, std::string{text}};
	}

	segment segment::build(std::string_view text)
	{ return {kind::build, std::string{text}}; }

	segment::kind segment::type() const
	{ return kind_; }

	const std::string& segment::value() const
	{ return value_; }

	bool segment::is_number() const
	{ return kind_ == kind::number; }

	bool segment::is_empty() const
	{ return compare_to_empty() == 0; }

	int segment::level() const
	{
		if (kind_ != kind::tag)
			return 0;

		auto word = to_lower(value_);

		if (word == "alpha" || word == "a")
			return -5;

		if (word == "beta" || word == "b")
			return -4;

		if (word == "milestone" || word == "m")
			return -3;

		if (word == "rc" || word == "cr")
			return -2;

		if (word == "snapshot")
			return -1;

		if (word.empty() || word == "ga" || word == "final" || word == "release")
			return 0;

		if (word == "sp")
			return 1;

		// unknown qualifiers are treated as early pre-releases
		return -6;
	}

	int segment::compare_to_empty() const
	{
		switch (kind_)
		{
			case kind::min:
				return -1;
			case kind::tag:
			{
				auto lvl = level();
				return (lvl > 0) - (lvl < 0);
			}
			case kind::number:
				return value_ == "0" ? 0 : 1;
			case kind::build:
				return 0;
			case kind::max:
				return 1;
		}

		return 0;
	}

	std::string segment::repr() const
	{
		switch (kind_)
		{
			case kind::min:
				return "min";
			case kind::max:
				return "max";
			default:
				return value_;
		}
	}

	std::weak_ordering segment::operator <=> (const segment &rhs) const
	{
		if (kind_ == rhs.kind_)
		{
			switch (kind_)
			{
				case kind::number:
					// no leading zeros, so longer means bigger
					if (auto len = value_.size() <=> rhs.value_.size(); len != 0)
						return len;

					return value_ <=> rhs.value_;

				case kind::tag:
					if (auto lvl = level() <=> rhs.level(); lvl != 0)
						return lvl;

					return to_lower(value_) <=> to_lower(rhs.value_);

				default:
					return std::weak_ordering::equivalent;
			}
		}

		if (auto rel = compare_to_empty() <=> rhs.compare_to_empty(); rel != 0)
			return rel;

		return kind_ <=> rhs.kind_;
	}

	bool segment::operator == (const segment &rhs) const
	{
		return kind_ == rhs.kind_ && value_ == rhs.value_;
	}

	static std::vector<segment> tokenize(std::string_view sv)
	{
		std::vector<segment> out;

		// start of input behaves like a separator for empty tokens
		bool after_sep = true;
		std::size_t i = 0;

		while (i < sv.size())
		{
			char c = sv[i];

			if (c == '+' && !out.empty())
			{
				out.push_back(segment::build(sv.substr(i + 1)));
				break;
			}

			if (c == '+' || is_separator(c))
			{
				if (after_sep)
					out.push_back(segment::tag(""));

				after_sep = true;
				++i;
				continue;
			}

			auto start = i;
			bool digits = is_digit(c);
			while (i < sv.size() && sv[i] != '+' && !is_separator(sv[i])
					&& is_digit(sv[i]) == digits)
				++i;

			auto token = sv.substr(start, i - start);
			out.push_back(digits ? segment::number(token) : segment::tag(token));
			after_sep = false;
		}

		return out;
	}

	version::version(std::string_view repr) :
		repr_{repr},
		segments_{tokenize(repr)}
	{}

	const std::string& version::repr() const
	{ return repr_; }

	const std::vector<segment>& version::segments() const
	{ return segments_; }

	std::weak_ordering version::operator <=> (const version &rhs) const
	{
		const auto &lhs_segs = segments_;
		const auto &rhs_segs = rhs.segments_;

		std::size_t i = 0;
		for (; i < lhs_segs.size() && i < rhs_segs.size(); ++i)
		{
			if (auto cmp = lhs_segs[i] <=> rhs_segs[i]; cmp != 0)
				return cmp;
		}

		// the longer version decides with its first non-empty leftover
		for (auto j = i; j < lhs_segs.size(); ++j)
		{
			if (auto rel = lhs_segs[j].compare_to_empty())
				return rel <=> 0;
		}

		for (auto j = i; j < rhs_segs.size(); ++j)
		{
			if (auto rel = rhs_segs[j].compare_to_empty())
				return 0 <=> rel;
		}

		return std::weak_ordering::equivalent;
	}

	bool version::operator == (const version &rhs) const
	{
		return segments_ == rhs.segments_;
	}

	std::ostream& operator << (std::ostream &os, const segment &s)
	{
		return os << s.repr();
	}

	std::ostream& operator << (std::ostream &os, const version &v)
	{
		return os << v.repr();
	}
}
