#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <source_location>
#include <string_view>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "file.hpp"
#include "format.hpp"

namespace epochwise {
    using namespace boost::ut;

    // Reports both values with fmt on a mismatch; what names the compared quantity when given
    template<typename X, typename Y>
    bool expect_equal(const X &exp, const Y &act, const std::string_view what={},
        const std::source_location &loc=std::source_location::current())
    {
        const bool ok = exp == act;
        if (what.empty())
            expect(ok, loc) << fmt::format("expected {} but got {}", exp, act);
        else
            expect(ok, loc) << fmt::format("{}: expected {} but got {}", what, exp, act);
        return ok;
    }
}
