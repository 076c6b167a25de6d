#pragma once

#include <oxen/log.hpp>
#include <oxen/log/format.hpp>

#include "format.hpp"
#include "utils.hpp"

namespace cidgen
{
    inline auto log_cat = oxen::log::Cat("cidgen");

    namespace log = oxen::log;

    using namespace log::literals;

}  // namespace cidgen
