/**
 * @file service_container.hpp
 * @brief Typed registry of lazily constructed, memoized collaborators
 *
 * Design Pattern: Factory Method with Registry
 * - Each capability type registers one factory function
 * - resolve<T>() constructs on first use and memoizes the instance
 * - An optional instance identifier yields one memoized instance per id
 * - seed<T>() installs a ready-made instance (used by tests)
 *
 * Usage Example:
 *   @code
 *   ServiceContainer container;
 *   container.register_factory<IFetcher>([](ServiceContainer&) {
 *       return std::make_shared<HttpFetcher>(HttpFetcherConfig());
 *   });
 *   auto fetcher = container.resolve<IFetcher>();
 *   @endcode
 */

#ifndef FLIGHTCACHE_SERVICE_CONTAINER_HPP
#define FLIGHTCACHE_SERVICE_CONTAINER_HPP

#include "core/errors.hpp"
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace flightcache {

class ServiceContainer {
public:
    /**
     * @brief Environment the process is running in
     */
    enum class Context {
        Running,      ///< Normal operation
        UnitTesting   ///< Under a test runner (FLIGHTCACHE_UNIT_TESTING is set)
    };

    template <typename T>
    using Factory = std::function<std::shared_ptr<T>(ServiceContainer&)>;

    template <typename T>
    using IdentifiedFactory = std::function<std::shared_ptr<T>(ServiceContainer&, const std::string&)>;

    ServiceContainer()
        : default_context_(std::getenv("FLIGHTCACHE_UNIT_TESTING") ? Context::UnitTesting
                                                                    : Context::Running) {}

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Process-wide container
     */
    static ServiceContainer& shared() {
        static ServiceContainer container;
        return container;
    }

    Context context() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return override_context_ ? *override_context_ : default_context_;
    }

    void set_override_context(std::optional<Context> context) {
        std::lock_guard<std::mutex> lock(mutex_);
        override_context_ = context;
    }

    /**
     * @brief Register the factory for a capability type
     *
     * Re-registering replaces the factory and discards memoized instances.
     */
    template <typename T>
    void register_factory(Factory<T> factory) {
        register_identified_factory<T>(
            [factory = std::move(factory)](ServiceContainer& container, const std::string&) {
                return factory(container);
            });
    }

    /**
     * @brief Register a factory that receives the requested instance identifier
     */
    template <typename T>
    void register_identified_factory(IdentifiedFactory<T> factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        Resolver& resolver = resolvers_[std::type_index(typeid(T))];
        resolver.factory = [factory = std::move(factory)](ServiceContainer& container,
                                                          const std::string& id) {
            return std::static_pointer_cast<void>(factory(container, id));
        };
        resolver.instances.clear();
    }

    /**
     * @brief Resolve the memoized instance of T
     *
     * @throws ConfigurationError If T has neither a factory nor a seeded instance
     */
    template <typename T>
    std::shared_ptr<T> resolve() {
        return resolve<T>(std::string());
    }

    /**
     * @brief Resolve the memoized instance of T for @p instance_id
     */
    template <typename T>
    std::shared_ptr<T> resolve(const std::string& instance_id) {
        const std::type_index key(typeid(T));
        std::function<std::shared_ptr<void>(ServiceContainer&, const std::string&)> factory;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = resolvers_.find(key);
            if (it == resolvers_.end()) {
                throw ConfigurationError(std::string("No factory registered for ") + typeid(T).name());
            }
            auto existing = it->second.instances.find(instance_id);
            if (existing != it->second.instances.end()) {
                return std::static_pointer_cast<T>(existing->second);
            }
            if (!it->second.factory) {
                throw ConfigurationError(std::string("No factory registered for ") + typeid(T).name() +
                                         " instance '" + instance_id + "'");
            }
            factory = it->second.factory;
        }

        // Construct outside the lock so factories can resolve their own dependencies
        std::shared_ptr<void> created = factory(*this, instance_id);

        std::lock_guard<std::mutex> lock(mutex_);
        auto& instances = resolvers_[key].instances;
        auto inserted = instances.emplace(instance_id, std::move(created));
        return std::static_pointer_cast<T>(inserted.first->second);
    }

    /**
     * @brief Install a ready-made instance of T
     */
    template <typename T>
    void seed(std::shared_ptr<T> instance) {
        seed<T>(std::string(), std::move(instance));
    }

    template <typename T>
    void seed(const std::string& instance_id, std::shared_ptr<T> instance) {
        std::lock_guard<std::mutex> lock(mutex_);
        resolvers_[std::type_index(typeid(T))].instances[instance_id] =
            std::static_pointer_cast<void>(std::move(instance));
    }

    template <typename T>
    bool is_registered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = resolvers_.find(std::type_index(typeid(T)));
        return it != resolvers_.end() && (it->second.factory || !it->second.instances.empty());
    }

    /**
     * @brief Drop memoized instances but keep the registered factories
     */
    void reset_instances() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : resolvers_) {
            entry.second.instances.clear();
        }
    }

    /**
     * @brief Drop every factory and instance
     */
    void remove_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        resolvers_.clear();
    }

private:
    struct Resolver {
        std::function<std::shared_ptr<void>(ServiceContainer&, const std::string&)> factory;
        std::map<std::string, std::shared_ptr<void>> instances;
    };

    mutable std::mutex mutex_;
    std::map<std::type_index, Resolver> resolvers_;
    const Context default_context_;
    std::optional<Context> override_context_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_SERVICE_CONTAINER_HPP
