#ifndef GULACHEK_VERCOMPAT_HPP
#define GULACHEK_VERCOMPAT_HPP

#include "gulachek/vercompat/version.hpp"
#include "gulachek/vercompat/interval.hpp"
#include "gulachek/vercompat/constraint.hpp"
#include "gulachek/vercompat/compatibility.hpp"
#include "gulachek/vercompat/settings.hpp"

#endif
