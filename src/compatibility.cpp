#include "gulachek/vercompat/compatibility.hpp"
#include "gulachek/vercompat/constraint.hpp"
#include "gulachek/vercompat/version.hpp"

#include <gulachek/gtree/encoding/string.hpp>

#include <algorithm>
#include <sstream>
#include <vector>

namespace gulachek::vercompat
{
	using segments = std::vector<segment>;

	static std::string ambiguous_message(std::string_view name)
	{
		std::ostringstream os;
		os << '\'' << name << "' is ambiguous." << std::endl
			<< "Semantic Versioning 2.0.0 treats every 0.y.z release as initial "
			<< "development, so 0.6.0 and 0.6.1 share no compatibility, while "
			<< "many ecosystems already keep compatibility within 0.y releases."
			<< std::endl << std::endl
			<< "Specify 'early-semver' for the early variant." << std::endl
			<< "Specify 'semver-spec' for the spec-correct SemVer.";
		return os.str();
	}

	ambiguous_policy::ambiguous_policy(std::string_view name) :
		std::logic_error{ambiguous_message(name)}
	{}

	static bool all_numeric(const segments &segs, std::size_t n)
	{
		n = std::min(n, segs.size());
		return std::all_of(segs.begin(), segs.begin() + n,
				[](const segment &s){ return s.is_number(); });
	}

	// first n segments of each, compared as whole sequences
	static bool same_prefix(const segments &a, const segments &b, std::size_t n)
	{
		auto na = std::min(n, a.size());
		auto nb = std::min(n, b.size());
		return na == nb && std::equal(a.begin(), a.begin() + na, b.begin());
	}

	// segments after the first n, plain lexicographic order
	static bool rest_less_equal(const segments &a, const segments &b, std::size_t n)
	{
		auto a_first = a.begin() + std::min(n, a.size());
		auto b_first = b.begin() + std::min(n, b.size());
		return !std::lexicographical_compare(b_first, b.end(), a_first, a.end());
	}

	// a leading empty segment (0.x or a leading separator) widens the anchor
	static std::size_t significant_length(const segments &segs)
	{
		return !segs.empty() && segs.front().is_empty() ? 2 : 1;
	}

	template <typename Match>
	static bool preferred_match(
			std::string_view constraint,
			std::string_view ver,
			Match &&match
			)
	{
		if (constraint == ver)
			return true;

		version_constraint c;
		if (auto err = version_constraint::parse(constraint, &c))
			return false;

		version v{ver};

		if (!c.interval().is_zero())
			return c.interval().contains(v);

		const auto &preferred = c.preferred();
		return std::any_of(preferred.begin(), preferred.end(),
				[&](const version &wanted){ return match(wanted, v); });
	}

	static bool strict_compatible(std::string_view constraint, std::string_view ver)
	{
		return preferred_match(constraint, ver,
				[](const version &wanted, const version &v){
					return wanted == v;
				});
	}

	static bool early_semver_compatible(std::string_view constraint, std::string_view ver)
	{
		return preferred_match(constraint, ver,
				[](const version &wanted, const version &v){
					const auto &w = wanted.segments();
					const auto &s = v.segments();
					auto n = significant_length(s);

					return all_numeric(w, w.size())
						&& same_prefix(w, s, n)
						&& rest_less_equal(w, s, n);
				});
	}

	static bool semver_spec_compatible(std::string_view constraint, std::string_view ver)
	{
		return preferred_match(constraint, ver,
				[](const version &wanted, const version &v){
					const auto &w = wanted.segments();
					const auto &s = v.segments();

					// 0.x and major-less versions are never cross compatible
					if (s.empty() || s.front().is_empty())
						return false;

					return all_numeric(w, w.size())
						&& same_prefix(w, s, 1)
						&& rest_less_equal(w, s, 1);
				});
	}

	static bool pvp_compatible(std::string_view constraint, std::string_view ver)
	{
		return preferred_match(constraint, ver,
				[](const version &wanted, const version &v){
					return same_prefix(wanted.segments(), v.segments(), 2);
				});
	}

	// render the first n segments if they are numeric and not above ver
	static std::string numeric_prefix_or_self(
			std::string_view ver,
			std::size_t n,
			bool require_major
			)
	{
		version v{ver};
		const auto &segs = v.segments();
		n = std::min(n, segs.size());

		if (require_major && (n == 0 || segs.front().is_empty()))
			return std::string{ver};

		if (!all_numeric(segs, n))
			return std::string{ver};

		std::string candidate;
		for (std::size_t i = 0; i < n; ++i)
		{
			if (i > 0)
				candidate += '.';

			candidate += segs[i].repr();
		}

		if (version{candidate} <= v)
			return candidate;

		return std::string{ver};
	}

	compatibility::kind compatibility::type() const
	{ return kind_; }

	std::string_view compatibility::name() const
	{
		switch (kind_)
		{
			case kind::always:
				return "always compatible";
			case kind::strict:
				return "strict";
			case kind::semver_spec:
				return "strict semantic versioning";
			case kind::semver:
			case kind::early_semver:
				return "early semantic versioning";
			case kind::default_:
			case kind::pvp:
				return "package versioning policy";
		}

		return "unknown";
	}

	std::string_view compatibility::token() const
	{
		switch (kind_)
		{
			case kind::default_:
				return "default";
			case kind::always:
				return "always";
			case kind::strict:
				return "strict";
			case kind::semver:
			case kind::early_semver:
				return "early-semver";
			case kind::semver_spec:
				return "semver-spec";
			case kind::pvp:
				return "pvp";
		}

		return "default";
	}

	bool compatibility::is_compatible(
			std::string_view constraint,
			std::string_view version
			) const
	{
		switch (kind_)
		{
			case kind::always:
				return true;
			case kind::strict:
				return strict_compatible(constraint, version);
			case kind::semver:
			case kind::early_semver:
				return early_semver_compatible(constraint, version);
			case kind::semver_spec:
				return semver_spec_compatible(constraint, version);
			case kind::default_:
			case kind::pvp:
				return pvp_compatible(constraint, version);
		}

		return false;
	}

	std::string compatibility::minimum_compatible_version(std::string_view version) const
	{
		switch (kind_)
		{
			case kind::always:
				return "0";
			case kind::strict:
				return std::string{version};
			case kind::semver:
			case kind::early_semver:
			{
				vercompat::version v{version};
				return numeric_prefix_or_self(version,
						significant_length(v.segments()), false);
			}
			case kind::semver_spec:
				return numeric_prefix_or_self(version, 1, true);
			case kind::default_:
			case kind::pvp:
				return numeric_prefix_or_self(version, 2, false);
		}

		return std::string{version};
	}

	std::optional<compatibility> compatibility::from_name(std::string_view name)
	{
		if (name == "default")
			return kind::default_;

		if (name == "always")
			return kind::always;

		if (name == "strict")
			return kind::strict;

		if (name == "early-semver")
			return kind::early_semver;

		if (name == "semver-spec")
			return kind::semver_spec;

		if (name == "pvp")
			return kind::pvp;

		if (name == "semver")
			throw ambiguous_policy{name};

		return std::nullopt;
	}

	bool compatibility::operator == (const compatibility &rhs) const
	{
		return kind_ == rhs.kind_;
	}

	error compatibility::gtree_encode(gtree::tree_writer &w) const
	{
		std::string tok{token()};
		gtree::encoding<std::string> enc{tok};
		return enc.encode(w);
	}

	error compatibility::gtree_decode(gtree::treeder &r)
	{
		std::string tok;
		gtree::decoding<std::string> dec{&tok};
		if (auto err = dec.decode(r))
			return err.wrap() << "failed to decode compatibility";

		auto compat = from_name(tok);
		if (!compat)
		{
			error err;
			err << "unknown version compatibility '" << tok << '\'';
			return err;
		}

		*this = *compat;
		return {};
	}

	std::ostream& operator << (std::ostream &os, const compatibility &c)
	{
		return os << c.name();
	}
}
