#include "gulachek/vercompat/constraint.hpp"

#include <optional>
#include <string>
#include <utility>

namespace gulachek::vercompat
{
	static std::string_view trim(std::string_view sv)
	{
		auto first = sv.find_first_not_of(" \t\r\n");
		if (first == std::string_view::npos)
			return {};

		auto last = sv.find_last_not_of(" \t\r\n");
		return sv.substr(first, last - first + 1);
	}

	version_constraint::version_constraint(
			std::vector<version> preferred,
			version_interval interval
			) :
		preferred_{std::move(preferred)},
		interval_{std::move(interval)}
	{}

	version_constraint version_constraint::from_version(version v)
	{
		std::vector<version> preferred;
		preferred.emplace_back(std::move(v));
		return {std::move(preferred), version_interval::zero()};
	}

	version_constraint version_constraint::from_interval(version_interval i)
	{ return {{}, std::move(i)}; }

	const std::vector<version>& version_constraint::preferred() const
	{ return preferred_; }

	const version_interval& version_constraint::interval() const
	{ return interval_; }

	bool version_constraint::is_empty() const
	{ return preferred_.empty() && interval_.is_zero(); }

	bool version_constraint::operator == (const version_constraint &rhs) const
	{
		return preferred_ == rhs.preferred_ && interval_ == rhs.interval_;
	}

	static error parse_interval(std::string_view sv, version_constraint *out)
	{
		error err;
		using ec = constraint_error_code;

		char open = sv.front();
		char close = sv.size() > 1 ? sv.back() : '\0';

		if (close != ']' && close != ')')
		{
			err.ucode(ec::unterminated_interval);
			err << "Interval is not terminated: " << sv;
			return err;
		}

		bool from_included = open == '[';
		bool to_included = close == ']';
		auto body = sv.substr(1, sv.size() - 2);

		auto comma = body.find(',');
		if (comma == std::string_view::npos)
		{
			auto exact = trim(body);
			if (exact.empty())
			{
				err.ucode(ec::missing_version);
				err << "Interval has no version: " << sv;
				return err;
			}

			if (!(from_included && to_included))
			{
				err.ucode(ec::exact_not_inclusive);
				err << "Single version interval must be inclusive: " << sv;
				return err;
			}

			version v{exact};
			*out = version_constraint::from_interval({v, v, true, true});
			return {};
		}

		if (body.find(',', comma + 1) != std::string_view::npos)
		{
			err.ucode(ec::too_many_bounds);
			err << "Interval has more than two bounds: " << sv;
			return err;
		}

		auto lo = trim(body.substr(0, comma));
		auto hi = trim(body.substr(comma + 1));

		std::optional<version> from, to;
		if (!lo.empty())
			from = version{lo};

		if (!hi.empty())
			to = version{hi};

		if (from && to)
		{
			auto cmp = *from <=> *to;
			if (cmp > 0 || (cmp == 0 && !(from_included && to_included)))
			{
				err.ucode(ec::inverted_interval);
				err << "Interval excludes every version: " << sv;
				return err;
			}
		}

		*out = version_constraint::from_interval(
				{std::move(from), std::move(to), from_included, to_included});
		return {};
	}

	error version_constraint::parse(std::string_view sv, version_constraint *out)
	{
		*out = {};
		auto s = trim(sv);

		if (!s.empty() && (s.front() == '[' || s.front() == '('))
			return parse_interval(s, out);

		// prefix: "1.2.+" or "1.2+"
		if (!s.empty() && s.back() == '+')
		{
			auto prefix = s.substr(0, s.size() - 1);
			if (!prefix.empty())
			{
				char last = prefix.back();
				if (last == '.' || last == '-' || last == '_')
					prefix.remove_suffix(1);
			}

			if (!prefix.empty())
			{
				version from{prefix};
				version to{std::string{prefix} + ".max"};
				*out = from_interval({std::move(from), std::move(to), true, true});
				return {};
			}
		}

		*out = from_version(version{s});
		return {};
	}

	std::ostream& operator << (std::ostream &os, const version_constraint &c)
	{
		if (!c.interval().is_zero())
			return os << c.interval();

		bool first = true;
		for (const auto &v : c.preferred())
		{
			if (!first)
				os << " | ";

			os << v;
			first = false;
		}

		return os;
	}
}
