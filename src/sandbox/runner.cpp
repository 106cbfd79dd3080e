/*
 * runner.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "runner.hpp"
#include "config_discovery.hpp"
#include "harness_generator.hpp"
#include "policy_resolver.hpp"
#include "result_reporter.hpp"
#include "session.hpp"
#include "supervisor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

namespace lockbox::sandbox {

// ============================================================================
// SandboxRunner::Impl
// ============================================================================

class SandboxRunner::Impl {
public:
    /**
     * @brief Marks one call in flight from admission until it returns
     *
     * Records the cancel generation at admission; a later cancel() applies
     * to the call even before it reaches the supervisor.
     */
    class Ticket {
    public:
        explicit Ticket(Impl& impl)
            : impl_(&impl), generation_(impl.cancelGeneration_.load()) {
            impl.inFlight_.fetch_add(1);
        }

        ~Ticket() {
            if (impl_ != nullptr) {
                impl_->inFlight_.fetch_sub(1);
            }
        }

        Ticket(Ticket&& other) noexcept
            : impl_(std::exchange(other.impl_, nullptr)),
              generation_(other.generation_) {}

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        Ticket& operator=(Ticket&&) = delete;

        [[nodiscard]] uint64_t generation() const noexcept {
            return generation_;
        }

    private:
        Impl* impl_;
        uint64_t generation_;
    };

    explicit Impl(const config::SandboxConfig& config)
        : config_(config), supervisor_(config_) {}

    ExecutionResult run(std::string_view code, const RunOptions& options,
                        Ticket ticket) {
        std::lock_guard lock(runMutex_);
        supervisor_.reset();
        if (cancelGeneration_.load() != ticket.generation()) {
            // reset() dropped a cancel aimed at this call; the supervisor
            // reports it before spawning anything
            supervisor_.cancel();
        }

        std::unique_ptr<SandboxSession> session;
        try {
            session = std::make_unique<SandboxSession>(options, config_);
            spdlog::debug("Session {} created in {}", session->id(),
                          session->workingDir().string());

            HarnessGenerator generator(config_);
            generator.generate(*session, code);

            auto outcome = supervisor_.run(*session);
            auto result = ResultReporter::report(outcome, session->policy());
            session->cleanup();

            spdlog::info("Session {} finished: {} exit={} {}ms",
                         session->id(),
                         result.errorReason
                             ? errorReasonToString(*result.errorReason)
                             : std::string_view("success"),
                         result.exitCode, result.elapsed.count());
            if (!result.diagnostic.empty()) {
                spdlog::debug("Session {}: {}", session->id(),
                              result.diagnostic);
            }
            return result;
        } catch (const SandboxException& e) {
            spdlog::error("Sandbox setup failed ({}): {}",
                          sandboxErrorToString(e.error()), e.what());
            return failure(session.get(), options, e.what());
        } catch (const std::exception& e) {
            spdlog::error("Sandbox execution failed: {}", e.what());
            return failure(session.get(), options, e.what());
        }
    }

    ExecutionResult failure(const SandboxSession* session,
                            const RunOptions& options,
                            const std::string& message) {
        if (session != nullptr) {
            return ResultReporter::supervisorFailure(session->policy(),
                                                     message);
        }
        // No working directory exists; report the caller's limits only
        auto policy = PolicyResolver(config_).resolve(options, {});
        policy.fsAllowlist.erase(
            std::remove_if(policy.fsAllowlist.begin(), policy.fsAllowlist.end(),
                           [](const auto& path) { return path.empty(); }),
            policy.fsAllowlist.end());
        return ResultReporter::supervisorFailure(policy, message);
    }

    bool cancel() noexcept {
        if (inFlight_.load() == 0) {
            return false;
        }
        cancelGeneration_.fetch_add(1);
        supervisor_.cancel();
        return true;
    }

    void setConfig(const config::SandboxConfig& config) {
        std::lock_guard lock(runMutex_);
        config_ = config;
    }

    config::SandboxConfig config_;
    ProcessSupervisor supervisor_;
    std::mutex runMutex_;
    std::atomic<uint64_t> cancelGeneration_{0};
    std::atomic<int> inFlight_{0};
};

// ============================================================================
// SandboxRunner
// ============================================================================

SandboxRunner::SandboxRunner()
    : pImpl_(std::make_shared<Impl>(config::SandboxConfig{})) {}

SandboxRunner::SandboxRunner(const config::SandboxConfig& config)
    : pImpl_(std::make_shared<Impl>(config)) {}

SandboxRunner::~SandboxRunner() {
    if (pImpl_) {
        pImpl_->cancel();
    }
}

SandboxRunner::SandboxRunner(SandboxRunner&&) noexcept = default;

SandboxRunner& SandboxRunner::operator=(SandboxRunner&& other) noexcept {
    if (this != &other) {
        if (pImpl_) {
            pImpl_->cancel();
        }
        pImpl_ = std::move(other.pImpl_);
    }
    return *this;
}

void SandboxRunner::setConfig(const config::SandboxConfig& config) {
    pImpl_->setConfig(config);
}

const config::SandboxConfig& SandboxRunner::getConfig() const {
    return pImpl_->config_;
}

Result<void> SandboxRunner::validateConfig() const {
    return ConfigDiscovery::validateConfig(pImpl_->config_);
}

ExecutionResult SandboxRunner::runCode(std::string_view code,
                                       const RunOptions& options) {
    return pImpl_->run(code, options, Impl::Ticket(*pImpl_));
}

std::future<ExecutionResult> SandboxRunner::runCodeAsync(std::string code,
                                                         RunOptions options) {
    // Admitted here so a cancel() right after this call is not lost
    Impl::Ticket ticket(*pImpl_);
    return std::async(std::launch::async,
                      [impl = pImpl_, ticket = std::move(ticket),
                       code = std::move(code),
                       options = std::move(options)]() mutable {
                          return impl->run(code, options, std::move(ticket));
                      });
}

bool SandboxRunner::cancel() {
    if (!pImpl_->cancel()) {
        return false;
    }
    spdlog::info("Cancelling sessions in flight");
    return true;
}

bool SandboxRunner::isRunning() const {
    return pImpl_->inFlight_.load() > 0;
}

ExecutionResult runCode(std::string_view code, const RunOptions& options,
                        const config::SandboxConfig& config) {
    SandboxRunner runner(config);
    return runner.runCode(code, options);
}

}  // namespace lockbox::sandbox
