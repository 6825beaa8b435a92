#ifndef GULACHEK_VERCOMPAT_COMPATIBILITY_HPP
#define GULACHEK_VERCOMPAT_COMPATIBILITY_HPP

#include <gulachek/gtree.hpp>
#include <gulachek/error.hpp>

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gulachek::vercompat
{
	// thrown for names that could mean more than one policy
	class VERCOMPAT_API ambiguous_policy : public std::logic_error
	{
		public:
			explicit ambiguous_policy(std::string_view name);
	};

	/**
	 * Rule for deciding whether a resolved version can stand in for a
	 * declared constraint during conflict reconciliation.
	 */
	class VERCOMPAT_API compatibility
	{
		public:
			enum class kind
			{
				default_,
				always,
				strict,
				semver, // deprecated alias of early_semver
				early_semver,
				semver_spec,
				pvp
			};

			compatibility(kind k = kind::default_) :
				kind_{k}
			{}

			GTREE_DECLARE_MEMBER_FNS;

			kind type() const;

			// label for diagnostics
			std::string_view name() const;

			// configuration name accepted by from_name
			std::string_view token() const;

			/**
			 * Test whether version satisfies constraint
			 * @param constraint A preferred version, prefix or interval
			 * @param version The resolved version in question
			 * @returns true if compatible. Malformed input is never compatible
			 * unless both strings are identical.
			 */
			bool is_compatible(
					std::string_view constraint,
					std::string_view version
					) const;

			/**
			 * Lowest version that version is still compatible with
			 * @returns a version ordered at or below version, or version
			 * itself when no shorter candidate qualifies
			 */
			std::string minimum_compatible_version(std::string_view version) const;

			/**
			 * Look up a policy from its configuration name
			 * @returns nullopt for unknown names
			 * @throws ambiguous_policy for "semver"
			 */
			static std::optional<compatibility> from_name(std::string_view name);

			bool operator == (const compatibility &rhs) const;

		private:
			kind kind_;
	};

	VERCOMPAT_API std::ostream& operator << (std::ostream &os, const compatibility &c);
}

#endif
