/**
 * @file endpoint_pool.cpp
 * @brief Virtual port pool implementation
 * @version 0.1
 * @date 2025-11-10
 */

#include "../include/pattern/endpoint_pool.hpp"
#include "../include/io/pty_pair.hpp"
#include "../include/log.hpp"

namespace serialmux {

    EndpointPool::EndpointPool(const std::vector<std::string>& symlink_paths,
        VirtualEndpoint::PtyFactory factory,
        std::chrono::milliseconds retry_interval)
        : retries_(symlink_paths.size()), retry_interval_(retry_interval) {
        endpoints_.reserve(symlink_paths.size());
        for (const auto& path : symlink_paths) {
            endpoints_.push_back(std::make_unique<VirtualEndpoint>(path, factory));
        }
    }

    std::unique_ptr<EndpointPool> EndpointPool::create(
        const std::vector<std::string>& symlink_paths,
        std::chrono::milliseconds retry_interval) {
        auto factory = [](const std::string&) {
                return std::unique_ptr<IPtyChannel>(std::make_unique<PtyPair>());
            };
        return std::make_unique<EndpointPool>(symlink_paths, factory, retry_interval);
    }

    EndpointPool::~EndpointPool() {
        begin_shutdown();
        close_all();
    }

    std::size_t EndpointPool::open_all() {
        std::size_t opened = 0;
        for (auto& endpoint : endpoints_) {
            if (endpoint->open()) {
                ++opened;
            }
        }
        log::info("POOL", std::to_string(opened) + "/" + std::to_string(endpoints_.size()) +
            " virtual ports ready");
        return opened;
    }

    std::size_t EndpointPool::supervise(Clock::time_point now) {
        if (is_shutting_down()) {
            return 0;
        }

        std::size_t recreated = 0;
        for (std::size_t i = 0; i < endpoints_.size(); ++i) {
            auto& endpoint = *endpoints_[i];
            auto& retry = retries_[i];

            bool needs_recreate = endpoint.is_dead();
            if (needs_recreate && retry.failing && now < retry.not_before) {
                continue;
            }
            if (!needs_recreate && !endpoint.verify_link()) {
                log::warn("POOL", endpoint.get_symlink_path() +
                    " no longer points to " + endpoint.get_slave_name());
                needs_recreate = true;
            }
            if (!needs_recreate) {
                continue;
            }

            ++recreated;
            ++recreations_;
            if (endpoint.recreate()) {
                if (retry.failing) {
                    log::info("POOL", endpoint.get_symlink_path() + " is back");
                }
                retry.failing = false;
                continue;
            }

            if (!retry.failing) {
                log::warn("POOL", "Recreation of " + endpoint.get_symlink_path() +
                    " failed, retrying every " + std::to_string(retry_interval_.count()) + "ms");
            }
            retry.failing = true;
            retry.not_before = now + retry_interval_;
        }
        return recreated;
    }

    std::size_t EndpointPool::accept_clients() {
        std::size_t attached = 0;
        for (auto& endpoint : endpoints_) {
            if (endpoint->accept_client()) {
                ++attached;
            }
        }
        return attached;
    }

    void EndpointPool::close_all() {
        for (auto& endpoint : endpoints_) {
            endpoint->close();
        }
    }

    std::size_t EndpointPool::count(EndpointState state) const {
        std::size_t n = 0;
        for (const auto& endpoint : endpoints_) {
            if (endpoint->state() == state) {
                ++n;
            }
        }
        return n;
    }

} // namespace serialmux
