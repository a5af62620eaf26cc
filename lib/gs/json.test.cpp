/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/json.hpp>
#include <gs/test.hpp>

using namespace graph_sentinel;

suite json_suite = [] {
    "json"_test = [] {
        "save_pretty object"_test = [] {
            file::tmp t { "gs-json-save-pretty-object-test.json" };
            const json::object j {
                { "name", "abc" },
                { "version", 123 }
            };
            json::save_pretty(t.path(), j);
            const auto buf = file::read(t.path());
            expect(buf == "{\n  \"name\": \"abc\",\n  \"version\": 123\n}") << buf;
            expect(json::load(t.path()).as_object() == j);
        };
        "save_pretty array"_test = [] {
            file::tmp t { "gs-json-save-pretty-array-test.json" };
            json::save_pretty(t.path(), json::array { "name", 123 });
            const auto buf = file::read(t.path());
            expect(buf == "[\n  \"name\",\n  123\n]") << buf;
        };
        "as_integer"_test = [] {
            test_same(-5, *json::as_integer(json::value(-5)));
            test_same(7, *json::as_integer(json::value(7ULL)));
            expect(!json::as_integer(json::value(18446744073709551615ULL)));
            expect(!json::as_integer(json::value(1.5)));
            expect(!json::as_integer(json::value("1")));
        };
        "as_number"_test = [] {
            test_close(1.5, *json::as_number(json::value(1.5)));
            test_close(3.0, *json::as_number(json::value(3)));
            expect(!json::as_number(json::value(true)));
        };
    };
};
