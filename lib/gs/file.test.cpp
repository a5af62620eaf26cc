/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <gs/file.hpp>
#include <gs/test.hpp>

using namespace graph_sentinel;

suite file_suite = [] {
    "file"_test = [] {
        "tmp"_test = [] {
            std::string tmp_path {};
            {
                file::tmp tmp1 { "gs-hello.txt" };
                tmp_path = tmp1.path();
                expect(!std::filesystem::exists(tmp1.path()));
                file::write(tmp1.path(), std::string_view { "Hello\n" });
                expect(std::filesystem::exists(tmp1.path()));
                test_same(std::string { "Hello\n" }, file::read(tmp1.path()));
            }
            expect(!std::filesystem::exists(tmp_path));
        };
        "files_with_ext"_test = [] {
            const auto dir = (std::filesystem::temp_directory_path() / "gs-files-with-ext-test").string();
            std::filesystem::remove_all(dir);
            file::write(dir + "/b.json", "{}");
            file::write(dir + "/a.json", "{}");
            file::write(dir + "/c.txt", "");
            const auto paths = file::files_with_ext(dir, ".json");
            test_same(2, paths.size());
            std::filesystem::remove_all(dir);
        };
        "read missing"_test = [] {
            expect(throws([] { file::read("/nonexistent/gs-file"); }));
        };
    };
};
