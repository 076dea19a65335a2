#include "kernel/kernel.hpp"
#include "policy/policy_client.hpp"
#include "runtime/docker_runtime.hpp"
#include "store/memory_store.hpp"
#include "store/redis_store.hpp"
#include "util/logger.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <csignal>
#include <cstring>
#include <map>

using json = nlohmann::json;

namespace warden::kernel {

namespace {

std::map<std::string, std::string> flatten_metadata(const json& metadata) {
    std::map<std::string, std::string> flat;
    if (!metadata.is_object()) return flat;
    for (const auto& [key, value] : metadata.items()) {
        flat[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return flat;
}

} // namespace

Kernel::Kernel(const Config& config)
    : Kernel(config, nullptr, nullptr, nullptr) {}

Kernel::Kernel(const Config& config,
               std::shared_ptr<runtime::ContainerRuntime> runtime,
               std::unique_ptr<balancer::HealthChecker> checker,
               std::unique_ptr<store::KeyValueStore> store)
    : config_(config)
    , reactor_(std::make_unique<Reactor>())
    , runtime_(std::move(runtime))
    , checker_(std::move(checker))
    , store_(std::move(store))
    , templates_(std::make_shared<runtime::TemplateRegistry>()) {
    if (!runtime_) {
        runtime_ = std::make_shared<runtime::DockerCliRuntime>(config_.docker_binary);
    }
    if (!checker_) {
        checker_ = std::make_unique<balancer::HttpHealthChecker>(*reactor_);
    }
}

Kernel::~Kernel() {
    if (initialized_) {
        stop_components();
    }
    // Components referencing the reactor go first
    sessions_.reset();
    persistence_.reset();
    balancer_.reset();
    checker_.reset();
    store_.reset();
    if (signal_fd_ >= 0) {
        reactor_->remove(signal_fd_);
        close(signal_fd_);
    }
}

bool Kernel::create_store() {
    if (store_) {
        return true;
    }
    if (config_.store_url == "memory://") {
        spdlog::warn("Using the in-process store; state is not shared between pods");
        store_ = std::make_unique<store::MemoryStore>(*reactor_);
        return true;
    }

    auto address = store::RedisAddress::parse(config_.store_url);
    if (!address) {
        spdlog::error("Unsupported store URL: {}", config_.store_url);
        return false;
    }
    auto redis = std::make_unique<store::RedisStore>(*reactor_, *address);
    redis->connect();
    store_ = std::move(redis);
    return true;
}

bool Kernel::install_signal_handler() {
    // Blocked before any worker thread starts so every thread inherits it
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        spdlog::error("Failed to block termination signals");
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        spdlog::error("Failed to create signalfd: {}", strerror(errno));
        return false;
    }
    return reactor_->add(signal_fd_, EPOLLIN, [this](int fd, uint32_t events) {
        on_signal_event(fd, events);
    });
}

void Kernel::on_signal_event(int fd, uint32_t events) {
    if (!(events & EPOLLIN)) return;

    struct signalfd_siginfo info;
    while (read(fd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
        spdlog::info("Received signal {}, shutting down...", info.ssi_signo);
        shutdown();
    }
}

bool Kernel::init() {
    spdlog::info("Initializing Warden kernel (pod={}, pool={})", config_.pod_name, config_.pool_name);
    util::set_log_level(util::parse_log_level(config_.log_level));

    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }
    if (!install_signal_handler()) {
        return false;
    }
    if (!create_store()) {
        return false;
    }

    if (!config_.templates_file.empty()) {
        size_t loaded = templates_->load_file(config_.templates_file);
        spdlog::info("Loaded {} custom templates from {}", loaded, config_.templates_file);
    }

    if (config_.policy_enabled) {
        policy_ = std::make_shared<policy::OpaPolicyClient>(config_.policy);
        spdlog::info("Policy: {} mode via {}", policy::policy_mode_to_string(config_.policy.mode),
                     config_.policy.opa_url);
    }

    balancer_ = std::make_unique<balancer::LoadBalancer>(*reactor_, *store_, *checker_, config_.balancer);
    persistence_ = std::make_unique<persistence::PersistenceManager>(*reactor_, *store_, config_.persistence);
    sessions_ = std::make_unique<session::SessionManager>(config_.sessions, runtime_, templates_);
    sessions_->set_policy_engine(policy_);
    sessions_->set_event_callback([this](const session::SessionEvent& event) {
        on_session_event(event);
    });

    balancer_->start([this](bool loaded) {
        if (!loaded) {
            spdlog::warn("Starting without stored pool state");
        }
        for (const auto& pool : config_.pools) {
            balancer_->register_pool(pool);
        }
    });
    persistence_->start();

    initialized_ = true;
    spdlog::info("Kernel initialized successfully");
    spdlog::info("Store: {}", config_.store_url);
    spdlog::info("Sessions: max {} (ttl {}s)", config_.sessions.max_sessions, config_.sessions.default_ttl);
    return true;
}

void Kernel::on_session_event(const session::SessionEvent& event) {
    // Called from session manager threads; persistence lives on the loop
    session::SessionEvent copy = event;
    reactor_->post([this, copy]() {
        if (!persistence_) return;
        switch (copy.type) {
            case session::SessionEventType::CREATED:
                persistence_->create_session(copy.session_id, config_.pool_name, config_.pod_name,
                                             copy.template_name, static_cast<int64_t>(copy.ttl),
                                             flatten_metadata(copy.metadata));
                break;
            case session::SessionEventType::DESTROYED:
            case session::SessionEventType::EXPIRED:
                persistence_->delete_session(copy.session_id, {});
                break;
        }
    });
}

void Kernel::run() {
    running_ = true;
    spdlog::info("Warden kernel v0.1.0 running");

    while (running_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }
    }

    spdlog::info("Kernel shutting down...");
    stop_components();
    spdlog::info("Kernel stopped");
}

void Kernel::shutdown() {
    running_ = false;
}

void Kernel::stop_components() {
    if (stopped_ || !initialized_) return;
    stopped_ = true;

    balancer_->stop();

    bool flushed = false;
    persistence_->stop([&flushed](bool ok) {
        if (!ok) spdlog::warn("Final persistence flush incomplete");
        flushed = true;
    });
    if (!reactor_->run_until([&flushed]() { return flushed; }, 10000)) {
        spdlog::warn("Timed out flushing session state");
    }

    // Sandboxes are torn down on shutdown but their records stay for restore
    sessions_->set_event_callback({});
    sessions_->stop();
}

} // namespace warden::kernel
