#pragma once

#include "diar/diarizer.hpp"
#include "mt/translation_interface.hpp"
#include "stt/stt_interface.hpp"
#include "utils/config.hpp"
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace speechjobs {
namespace core {

enum class CapabilityKind {
    TRANSCRIBER,
    DIARIZER,
    TRANSLATOR
};

std::string capabilityKindToString(CapabilityKind kind);

/**
 * Configuration a capability instance is keyed by
 */
struct CapabilityKey {
    CapabilityKind kind;
    std::string model;
    std::string device;

    bool operator<(const CapabilityKey& other) const {
        return std::tie(kind, model, device) < std::tie(other.kind, other.model, other.device);
    }
    bool operator==(const CapabilityKey& other) const {
        return kind == other.kind && model == other.model && device == other.device;
    }
    std::string toString() const;
};

/**
 * Shared reference to a loaded capability. When the capability kind is
 * configured as serialized, calls through use() hold the instance mutex for
 * the duration of the call only.
 */
template<typename T>
class CapabilityHandle {
public:
    CapabilityHandle(std::shared_ptr<T> instance, std::shared_ptr<std::mutex> callMutex)
        : instance_(std::move(instance)), call_mutex_(std::move(callMutex)) {}

    template<typename Fn>
    auto use(Fn&& fn) -> decltype(fn(std::declval<T&>())) {
        if (call_mutex_) {
            std::lock_guard<std::mutex> lock(*call_mutex_);
            return fn(*instance_);
        }
        return fn(*instance_);
    }

    bool isSerialized() const { return call_mutex_ != nullptr; }
    const std::shared_ptr<T>& instance() const { return instance_; }

private:
    std::shared_ptr<T> instance_;
    std::shared_ptr<std::mutex> call_mutex_;
};

/**
 * Lazily-initialized capability instances keyed by {kind, model, device}.
 *
 * Concurrent first users of a key share a single load. A failed load is
 * remembered and rethrown as ModelLoadException to later callers without
 * invoking the factory again, until reset() is called for that key.
 */
class CapabilityRegistry {
public:
    using TranscriberFactory = std::function<std::shared_ptr<stt::Transcriber>(const CapabilityKey&)>;
    using DiarizerFactory = std::function<std::shared_ptr<diar::Diarizer>(const CapabilityKey&)>;
    using TranslatorFactory = std::function<std::shared_ptr<mt::Translator>(const CapabilityKey&)>;

    explicit CapabilityRegistry(const utils::CapabilitySettings& settings = utils::CapabilitySettings());
    ~CapabilityRegistry() = default;

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    void registerTranscriberFactory(TranscriberFactory factory);
    void registerDiarizerFactory(DiarizerFactory factory);
    void registerTranslatorFactory(TranslatorFactory factory);

    bool hasFactory(CapabilityKind kind) const;

    /**
     * Per-kind call serialization. Applies to instances loaded afterwards.
     */
    void setSerialized(CapabilityKind kind, bool serialized);

    /**
     * Get (loading on first use) a capability instance
     * @throws ModelLoadException if no factory is registered or the load fails
     */
    CapabilityHandle<stt::Transcriber> transcriber(const std::string& model, const std::string& device);
    CapabilityHandle<diar::Diarizer> diarizer(const std::string& model, const std::string& device);
    CapabilityHandle<mt::Translator> translator(const std::string& model, const std::string& device);

    /**
     * Forget a key (including a cached load failure)
     */
    void reset(const CapabilityKey& key);
    void clear();

    bool isLoaded(const CapabilityKey& key) const;
    bool hasFailed(const CapabilityKey& key) const;
    std::vector<CapabilityKey> getLoadedKeys() const;

private:
    using ErasedFactory = std::function<std::shared_ptr<void>(const CapabilityKey&)>;

    struct Entry {
        std::shared_future<std::shared_ptr<void>> instance;
        std::shared_ptr<std::mutex> call_mutex;
    };

    std::pair<std::shared_ptr<void>, std::shared_ptr<std::mutex>>
    acquire(const CapabilityKey& key, const ErasedFactory& factory);

    template<typename T>
    CapabilityHandle<T> acquireAs(const CapabilityKey& key,
                                  const std::function<std::shared_ptr<T>(const CapabilityKey&)>& factory) {
        ErasedFactory erased;
        if (factory) {
            erased = [factory](const CapabilityKey& k) -> std::shared_ptr<void> { return factory(k); };
        }
        auto acquired = acquire(key, erased);
        return CapabilityHandle<T>(std::static_pointer_cast<T>(acquired.first), acquired.second);
    }

    static bool isReady(const Entry& entry);

    TranscriberFactory transcriber_factory_;
    DiarizerFactory diarizer_factory_;
    TranslatorFactory translator_factory_;
    std::map<CapabilityKind, bool> serialized_;

    std::map<CapabilityKey, Entry> entries_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace speechjobs
