/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <gs/logger.hpp>
#include <gs/validator/cross.hpp>

namespace graph_sentinel::validator {
    std::optional<std::string> check_shape(const int64_t start, const int64_t end, const int64_t min_range_size)
    {
        if (start <= 0 || end <= 0)
            return fmt::format("non-positive heights [{}, {}]", start, end);
        if (start >= end)
            return fmt::format("start {} is not below end {}", start, end);
        if (min_range_size <= 0)
            return fmt::format("min_range_size {} is not positive", min_range_size);
        if (end + 1 - start < min_range_size)
            return fmt::format("range [{}, {}] is narrower than {}", start, end, min_range_size);
        return {};
    }

    std::optional<std::string> check_range(const int64_t start, const int64_t end, const int64_t tip, const int64_t min_range_size, const int64_t lookahead_tolerance)
    {
        if (auto reason = check_shape(start, end, min_range_size); reason)
            return reason;
        if (end > tip + lookahead_tolerance)
            return fmt::format("end {} is ahead of the tip {}", end, tip);
        return {};
    }

    cross_check_result cross_validate(const transport::client &client, const miner::miner_info &target, const node::base &node,
        const int64_t claimed_start, const int64_t claimed_end, const cross_check_options &opts)
    {
        if (auto reason = check_shape(claimed_start, claimed_end, opts.min_range_size); reason) {
            logger::debug("{}: cross-validation failed: {}", target, *reason);
            return { cross_check_outcome::fail, 0.0, std::move(*reason) };
        }
        const auto tip = node.current_block_height();
        if (auto reason = check_range(claimed_start, claimed_end, tip, opts.min_range_size, opts.lookahead_tolerance); reason) {
            logger::debug("{}: cross-validation failed: {}", target, *reason);
            return { cross_check_outcome::fail, 0.0, std::move(*reason) };
        }
        // blocks within the lookahead tolerance may not exist yet
        const auto end = std::max(claimed_start, std::min(claimed_end, tip));
        const auto num_samples = static_cast<size_t>(std::min(opts.min_range_size, end - claimed_start + 1));
        const auto ch = node.create_challenge(claimed_start, end, num_samples);
        const auto resp = client.query(target, transport::challenge(ch.request()), opts.timeout);
        if (!resp.is_success() || !resp.output) {
            logger::debug("{}: cross-validation indeterminate: {}", target, resp);
            return { cross_check_outcome::indeterminate, resp.process_time, fmt::format("no answer: {}", resp) };
        }
        const auto *answers = node::data_samples(*resp.output);
        if (!answers) {
            logger::debug("{}: cross-validation indeterminate: the reply has no data samples", target);
            return { cross_check_outcome::indeterminate, resp.process_time, "no data samples" };
        }
        if (!node.validate_challenge_response_output(ch, *answers)) {
            logger::info("{}: cross-validation failed: wrong answers among {} blocks in [{}, {}]", target, ch.samples.size(), claimed_start, end);
            return { cross_check_outcome::fail, resp.process_time,
                fmt::format("wrong answers among {} sampled blocks in [{}, {}]", ch.samples.size(), claimed_start, end) };
        }
        logger::debug("{}: cross-validation passed on {} blocks", target, ch.samples.size());
        return { cross_check_outcome::pass, resp.process_time, {} };
    }
}
