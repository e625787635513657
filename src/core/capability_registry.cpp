#include "core/capability_registry.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace speechjobs {
namespace core {

std::string capabilityKindToString(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::TRANSCRIBER: return "transcriber";
        case CapabilityKind::DIARIZER: return "diarizer";
        case CapabilityKind::TRANSLATOR: return "translator";
    }
    return "unknown";
}

std::string CapabilityKey::toString() const {
    return capabilityKindToString(kind) + ":" + model + "@" + device;
}

CapabilityRegistry::CapabilityRegistry(const utils::CapabilitySettings& settings) {
    serialized_[CapabilityKind::TRANSCRIBER] = settings.serialize_transcriber;
    serialized_[CapabilityKind::DIARIZER] = settings.serialize_diarizer;
    serialized_[CapabilityKind::TRANSLATOR] = settings.serialize_translator;
}

void CapabilityRegistry::registerTranscriberFactory(TranscriberFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    transcriber_factory_ = std::move(factory);
}

void CapabilityRegistry::registerDiarizerFactory(DiarizerFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    diarizer_factory_ = std::move(factory);
}

void CapabilityRegistry::registerTranslatorFactory(TranslatorFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    translator_factory_ = std::move(factory);
}

bool CapabilityRegistry::hasFactory(CapabilityKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (kind) {
        case CapabilityKind::TRANSCRIBER: return static_cast<bool>(transcriber_factory_);
        case CapabilityKind::DIARIZER: return static_cast<bool>(diarizer_factory_);
        case CapabilityKind::TRANSLATOR: return static_cast<bool>(translator_factory_);
    }
    return false;
}

void CapabilityRegistry::setSerialized(CapabilityKind kind, bool serialized) {
    std::lock_guard<std::mutex> lock(mutex_);
    serialized_[kind] = serialized;
}

CapabilityHandle<stt::Transcriber> CapabilityRegistry::transcriber(const std::string& model,
                                                                   const std::string& device) {
    TranscriberFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory = transcriber_factory_;
    }
    return acquireAs<stt::Transcriber>({CapabilityKind::TRANSCRIBER, model, device}, factory);
}

CapabilityHandle<diar::Diarizer> CapabilityRegistry::diarizer(const std::string& model,
                                                              const std::string& device) {
    DiarizerFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory = diarizer_factory_;
    }
    return acquireAs<diar::Diarizer>({CapabilityKind::DIARIZER, model, device}, factory);
}

CapabilityHandle<mt::Translator> CapabilityRegistry::translator(const std::string& model,
                                                                const std::string& device) {
    TranslatorFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory = translator_factory_;
    }
    return acquireAs<mt::Translator>({CapabilityKind::TRANSLATOR, model, device}, factory);
}

std::pair<std::shared_ptr<void>, std::shared_ptr<std::mutex>>
CapabilityRegistry::acquire(const CapabilityKey& key, const ErasedFactory& factory) {
    std::promise<std::shared_ptr<void>> promise;
    std::shared_future<std::shared_ptr<void>> future;
    std::shared_ptr<std::mutex> callMutex;
    bool loader = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            if (!factory) {
                throw utils::ModelLoadException("No factory registered for capability", key.toString());
            }
            Entry entry;
            entry.instance = promise.get_future().share();
            if (serialized_[key.kind]) {
                entry.call_mutex = std::make_shared<std::mutex>();
            }
            it = entries_.emplace(key, entry).first;
            loader = true;
        }
        future = it->second.instance;
        callMutex = it->second.call_mutex;
    }

    if (loader) {
        // Load outside the registry lock; other callers of this key wait on the future.
        utils::Logger::info("Loading capability " + key.toString());
        auto startTime = std::chrono::steady_clock::now();
        try {
            auto instance = factory(key);
            if (!instance) {
                throw utils::ModelLoadException("Capability factory returned no instance", key.toString());
            }
            promise.set_value(std::move(instance));

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime);
            utils::Logger::info("Loaded capability " + key.toString() + " in " +
                                std::to_string(elapsed.count()) + "ms");
        } catch (const utils::ModelLoadException& e) {
            utils::Logger::error("Capability load failed for " + key.toString() + ": " + e.what());
            promise.set_exception(std::current_exception());
        } catch (const std::exception& e) {
            utils::Logger::error("Capability load failed for " + key.toString() + ": " + e.what());
            promise.set_exception(std::make_exception_ptr(
                utils::ModelLoadException("Failed to load capability", key.toString() + ": " + e.what())));
        }
    }

    return {future.get(), callMutex};
}

void CapabilityRegistry::reset(const CapabilityKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    // An in-flight load keeps its waiters; only settled entries are dropped.
    if (!isReady(it->second)) {
        utils::Logger::warn("Cannot reset capability " + key.toString() + " while it is loading");
        return;
    }
    entries_.erase(it);
    utils::Logger::info("Reset capability " + key.toString());
}

void CapabilityRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isReady(it->second)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

bool CapabilityRegistry::isLoaded(const CapabilityKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || !isReady(it->second)) {
        return false;
    }
    try {
        return it->second.instance.get() != nullptr;
    } catch (const utils::ModelLoadException&) {
        return false;
    }
}

bool CapabilityRegistry::hasFailed(const CapabilityKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || !isReady(it->second)) {
        return false;
    }
    try {
        it->second.instance.get();
        return false;
    } catch (const utils::ModelLoadException&) {
        return true;
    }
}

std::vector<CapabilityKey> CapabilityRegistry::getLoadedKeys() const {
    std::vector<CapabilityKey> keys;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (!isReady(entry.second)) {
            continue;
        }
        try {
            if (entry.second.instance.get()) {
                keys.push_back(entry.first);
            }
        } catch (const utils::ModelLoadException&) {
            // failed loads are not loaded keys
        }
    }
    return keys;
}

bool CapabilityRegistry::isReady(const Entry& entry) {
    return entry.instance.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace core
} // namespace speechjobs
