/**
 * @file resume_negotiator.cpp
 * @brief Implementation of the resume negotiation protocol
 */

#include "rtransfer/core/resume_negotiator.h"

#include "rtransfer/core/logging.h"

#include <system_error>

namespace rtransfer {

auto resume_negotiator::negotiate(const std::filesystem::path& destination,
                                  bool resume_allowed,
                                  std::optional<uint64_t> probed_remote_size) const
    -> result<resume_plan> {
    resume_plan plan;

    std::error_code ec;
    bool exists = std::filesystem::exists(destination, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "cannot inspect destination: " + ec.message()}};
    }

    if (!exists) {
        RT_LOG_DEBUG(log_category::resume,
                     "Destination absent, starting fresh: " + destination.string());
        return plan;
    }

    if (!std::filesystem::is_regular_file(destination, ec)) {
        return unexpected{error{error_code::file_open_error,
                                "destination is not a regular file: " + destination.string()}};
    }

    auto local_size = std::filesystem::file_size(destination, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "cannot read destination size: " + ec.message()}};
    }
    plan.local_size = local_size;

    if (!resume_allowed) {
        RT_LOG_DEBUG(log_category::resume,
                     "Resume disabled, truncating " + std::to_string(local_size) +
                         " existing bytes");
        return plan;
    }

    uint64_t remote = probed_remote_size.value_or(0);
    if (remote > 0 && local_size >= remote) {
        RT_LOG_INFO(log_category::resume,
                    "Destination already complete (" + std::to_string(local_size) +
                        " of " + std::to_string(remote) + " bytes)");
        plan.already_complete = true;
        return plan;
    }

    if (local_size == 0) {
        return plan;
    }

    plan.decision = resume_decision::append_from(local_size);
    RT_LOG_INFO(log_category::resume,
                "Resuming from byte " + std::to_string(local_size));
    return plan;
}

auto resume_negotiator::fallback() const -> resume_decision {
    return resume_decision::fresh();
}

auto resume_negotiator::reconcile(const resume_decision& decision,
                                  fetch_status status,
                                  std::optional<uint64_t> range_start) const
    -> result<resume_decision> {
    switch (status) {
        case fetch_status::partial:
            if (!decision.is_resume()) {
                return unexpected{error{error_code::unexpected_partial_content,
                                        "server sent partial content without a range request"}};
            }
            if (range_start && *range_start != decision.offset) {
                if (*range_start == 0) {
                    RT_LOG_WARN(log_category::resume,
                                "Server answered range " + decision.range->to_header() +
                                    " from byte 0, restarting");
                    return fallback();
                }
                return unexpected{error{error_code::range_mismatch,
                    "requested byte " + std::to_string(decision.offset) +
                        ", server sent content from byte " + std::to_string(*range_start)}};
            }
            return decision;

        case fetch_status::full:
            if (decision.is_resume()) {
                RT_LOG_WARN(log_category::resume,
                            "Server ignored range " + decision.range->to_header() +
                                ", restarting from byte 0");
                return fallback();
            }
            return decision;

        case fetch_status::error:
        default:
            return unexpected{error{error_code::http_error,
                                    "server returned an error response"}};
    }
}

}  // namespace rtransfer
