/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_TEST_HPP
#define GRAPH_SENTINEL_TEST_HPP

#define BOOST_UT_DISABLE_MODULE 1
#include <cmath>
#include <iostream>
#include <source_location>
#include <boost/ut.hpp>
#include <gs/error.hpp>
#include <gs/file.hpp>
#include <gs/logger.hpp>

namespace graph_sentinel {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    void test_close(const T &exp, const T &act, T eps=1e-4, const std::source_location &loc=std::source_location::current())
    {
        if (exp) {
            const auto e = std::fabs(act - exp) / act;
            expect(e <= eps, loc) << fmt::format("eps {} is too big for {} and {}", e, exp, act);
        } else {
            const auto d = std::fabs(act - exp);
            expect(d <= eps, loc) << fmt::format("delta {} is too big for {} and {}", d, exp, act);
        }
    }

    template<typename T, typename Y>
    void test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        expect(x == static_cast<T>(y), loc) << fmt::format("{} != {}", x, y);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<graph_sentinel::test_printer>> {};

#endif // !GRAPH_SENTINEL_TEST_HPP
