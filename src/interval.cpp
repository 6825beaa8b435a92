#include "gulachek/vercompat/interval.hpp"

#include <utility>

namespace gulachek::vercompat
{
	version_interval::version_interval(
			std::optional<version> from,
			std::optional<version> to,
			bool from_included,
			bool to_included
			) :
		from_{std::move(from)},
		to_{std::move(to)},
		from_included_{from_included},
		to_included_{to_included}
	{}

	version_interval version_interval::zero()
	{ return {}; }

	const std::optional<version>& version_interval::from() const
	{ return from_; }

	const std::optional<version>& version_interval::to() const
	{ return to_; }

	bool version_interval::from_included() const
	{ return from_included_; }

	bool version_interval::to_included() const
	{ return to_included_; }

	bool version_interval::is_zero() const
	{
		return *this == zero();
	}

	bool version_interval::contains(const version &v) const
	{
		if (from_)
		{
			auto cmp = *from_ <=> v;
			if (from_included_ ? cmp > 0 : cmp >= 0)
				return false;
		}

		if (to_)
		{
			auto cmp = v <=> *to_;
			if (to_included_ ? cmp > 0 : cmp >= 0)
				return false;
		}

		return true;
	}

	bool version_interval::operator == (const version_interval &rhs) const
	{
		return from_ == rhs.from_
			&& to_ == rhs.to_
			&& from_included_ == rhs.from_included_
			&& to_included_ == rhs.to_included_;
	}

	std::ostream& operator << (std::ostream &os, const version_interval &i)
	{
		os << (i.from_included() ? '[' : '(');

		if (i.from())
			os << *i.from();

		os << ',';

		if (i.to())
			os << *i.to();

		return os << (i.to_included() ? ']' : ')');
	}
}
