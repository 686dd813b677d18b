// EN: Implementation of the SignalHandler class.
// FR: Implémentation de la classe SignalHandler.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace ACE {

SignalHandler* SignalHandler::instance_ = nullptr;

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    instance_ = &instance;
    return instance;
}

// EN: Destructor restores default signal handlers.
// FR: Le destructeur restaure les gestionnaires de signaux par défaut.
SignalHandler::~SignalHandler() {
    if (initialized_) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }
    instance_ = nullptr;
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_WARN("signal_handler", "SignalHandler already initialized");
        return;
    }

    if (std::signal(SIGINT, signalCallback) == SIG_ERR) {
        LOG_ERROR("signal_handler", "Failed to register SIGINT handler");
        throw std::runtime_error("Failed to register SIGINT handler");
    }

    if (std::signal(SIGTERM, signalCallback) == SIG_ERR) {
        LOG_ERROR("signal_handler", "Failed to register SIGTERM handler");
        // EN: Restore SIGINT handler before throwing
        // FR: Restaure le handler SIGINT avant de lancer l'exception
        std::signal(SIGINT, SIG_DFL);
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    initialized_ = true;
    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::registerCleanupCallback(const std::string& name, CleanupCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(cleanup_callbacks_.begin(), cleanup_callbacks_.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it != cleanup_callbacks_.end()) {
        it->second = std::move(callback);
    } else {
        cleanup_callbacks_.emplace_back(name, std::move(callback));
    }

    LOG_DEBUG("signal_handler", "Registered cleanup callback: " + name +
              " (total: " + std::to_string(cleanup_callbacks_.size()) + ")");
}

void SignalHandler::unregisterCleanupCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(cleanup_callbacks_.begin(), cleanup_callbacks_.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it != cleanup_callbacks_.end()) {
        cleanup_callbacks_.erase(it);
        LOG_DEBUG("signal_handler", "Unregistered cleanup callback: " + name);
    } else {
        LOG_WARN("signal_handler", "Cleanup callback not found for unregistration: " + name);
    }
}

void SignalHandler::triggerShutdown(int signal_number) {
    LOG_INFO("signal_handler", "Manual shutdown triggered with signal: " + std::to_string(signal_number));
    signals_received_++;
    last_signal_ = signal_number;
    shutdown_requested_ = true;
}

// EN: Async-signal-safe: atomics only.
// FR: Sûr en contexte de signal : atomiques uniquement.
void SignalHandler::signalCallback(int signal_number) {
    if (instance_) {
        instance_->signals_received_++;
        instance_->last_signal_ = signal_number;
        instance_->shutdown_requested_ = true;
    }
}

size_t SignalHandler::runCleanup() {
    if (cleanup_done_.exchange(true)) {
        return 0;
    }

    std::vector<std::pair<std::string, CleanupCallback>> callbacks_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_copy = cleanup_callbacks_;
    }

    int signal_number = last_signal_.load();
    if (signal_number != 0) {
        std::string signal_name = (signal_number == SIGINT) ? "SIGINT" :
                                  (signal_number == SIGTERM) ? "SIGTERM" :
                                  "SIGNAL_" + std::to_string(signal_number);
        LOG_INFO("signal_handler", "Shutting down after " + signal_name);
    }

    size_t executed = 0;
    for (const auto& [name, callback] : callbacks_copy) {
        try {
            LOG_DEBUG("signal_handler", "Executing cleanup callback: " + name);
            callback();
            executed++;
        } catch (const std::exception& e) {
            LOG_ERROR("signal_handler", "Cleanup callback failed: " + name + " - " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_callbacks_executed_ += executed;
    }
    Logger::getInstance().flush();
    return executed;
}

SignalHandlerStats SignalHandler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SignalHandlerStats stats;
    stats.signals_received = signals_received_.load();
    stats.cleanup_callbacks_registered = cleanup_callbacks_.size();
    stats.cleanup_callbacks_executed = cleanup_callbacks_executed_;
    stats.last_signal = last_signal_.load();
    return stats;
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_.clear();
    cleanup_callbacks_executed_ = 0;
    shutdown_requested_ = false;
    cleanup_done_ = false;
    signals_received_ = 0;
    last_signal_ = 0;
    LOG_DEBUG("signal_handler", "SignalHandler reset completed");
}

} // namespace ACE
