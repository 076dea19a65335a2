/**
 * Warden Kernel
 *
 * Owns every subsystem of one pod and their lifecycle:
 * - Reactor (epoll event loop, timers, cross-thread posts)
 * - KeyValueStore (Redis or in-process)
 * - LoadBalancer and PersistenceManager (run on the reactor)
 * - SessionManager (thread-safe, local sandboxes)
 * - PolicyEngine (optional)
 *
 * Session lifecycle events from the session manager are mirrored into the
 * persistence manager through the reactor. SIGINT and SIGTERM arrive on a
 * signalfd and stop the loop.
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "balancer/health_checker.hpp"
#include "balancer/load_balancer.hpp"
#include "kernel/config.hpp"
#include "kernel/reactor.hpp"
#include "persistence/persistence_manager.hpp"
#include "policy/policy_engine.hpp"
#include "runtime/container_runtime.hpp"
#include "runtime/templates.hpp"
#include "session/session_manager.hpp"
#include "store/kv_store.hpp"

namespace warden::kernel {

class Kernel {
public:
    using Config = ServiceConfig;

    explicit Kernel(const Config& config);
    // Collaborators may be injected; null ones get the production default
    Kernel(const Config& config,
           std::shared_ptr<runtime::ContainerRuntime> runtime,
           std::unique_ptr<balancer::HealthChecker> checker,
           std::unique_ptr<store::KeyValueStore> store = nullptr);
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Initialize all subsystems
    bool init();

    // Run the loop (blocks until shutdown), then stop everything in order
    void run();

    // Request shutdown; safe from any thread
    void shutdown();

    bool is_running() const { return running_; }

    // Ordered teardown: health checks, persistence flush, sessions.
    // Called by run(); idempotent.
    void stop_components();

    Reactor& reactor() { return *reactor_; }
    store::KeyValueStore& store() { return *store_; }
    balancer::LoadBalancer& balancer() { return *balancer_; }
    persistence::PersistenceManager& persistence() { return *persistence_; }
    session::SessionManager& sessions() { return *sessions_; }
    runtime::TemplateRegistry& templates() { return *templates_; }

    const Config& get_config() const { return config_; }

private:
    Config config_;
    std::atomic<bool> running_{false};
    bool initialized_ = false;
    bool stopped_ = false;
    int signal_fd_ = -1;

    std::unique_ptr<Reactor> reactor_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    std::unique_ptr<balancer::HealthChecker> checker_;
    std::unique_ptr<store::KeyValueStore> store_;
    std::shared_ptr<runtime::TemplateRegistry> templates_;
    std::shared_ptr<policy::PolicyEngine> policy_;
    std::unique_ptr<balancer::LoadBalancer> balancer_;
    std::unique_ptr<persistence::PersistenceManager> persistence_;
    std::unique_ptr<session::SessionManager> sessions_;

    bool create_store();
    bool install_signal_handler();
    void on_signal_event(int fd, uint32_t events);
    void on_session_event(const session::SessionEvent& event);
};

} // namespace warden::kernel
