/**
 * @file result.hpp
 * @brief Result type for the non-throwing per-cycle I/O paths.
 * @version 0.1
 * @date 2025-11-10
 * @copyright Copyright (c) 2025
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace serialmux {

/**
 * @brief Value of type T or an error Status, with an error context chain.
 *
 * Forwarding code never throws on expected runtime conditions (no client,
 * device unplugged); it returns a Result and lets the owner of the handle
 * decide on the state transition. When an error is propagated through
 * error(other, op), the operation names accumulate so the final log line shows
 * the whole path, e.g. "Error: Device disconnected [read -> read_chunk]".
 *
 * @tparam T The type of the value being returned.
 */
    template<typename T>
    class Result {
        private:
            std::variant<T, Status> value_or_error_;
            std::vector<std::string> error_chain_;

        public:
            Result() : value_or_error_(Status::UNKNOWN) {
            }

            bool ok() const {
                return std::holds_alternative<T>(value_or_error_);
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            // Value access (throws std::bad_variant_access if error)
            const T& value() const {
                return std::get<T>(value_or_error_);
            }

            T& value() {
                return std::get<T>(value_or_error_);
            }

            /// Value if ok, otherwise the fallback
            T value_or(T fallback) const {
                return ok() ? std::get<T>(value_or_error_) : std::move(fallback);
            }

            Status error() const {
                return fail() ? std::get<Status>(value_or_error_) : Status::SUCCESS;
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = "Error: " + serialmux_category().message(
                    static_cast<int>(error()));
                if (!error_chain_.empty()) {
                    result += " [";
                    for (std::size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
                }
                return result;
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            static Result success(T val) {
                Result r;
                r.value_or_error_ = std::move(val);
                return r;
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.value_or_error_ = status;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            // Propagate error from another Result, appending this operation
            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& op = "") {
                Result r;
                r.value_or_error_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

} // namespace serialmux
