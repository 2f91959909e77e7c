//----------------------------------------------------------------------------------------------------------------------
// File: ServiceProvider.hpp
// Description: A type keyed locator used to hand the coordinator's shared components to one another. The provider
// only stores weak references, the owner of each service controls its lifetime.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <any>
#include <memory>
#include <typeindex>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Mesh {
//----------------------------------------------------------------------------------------------------------------------

class ServiceProvider;

//----------------------------------------------------------------------------------------------------------------------
} // Mesh namespace
//----------------------------------------------------------------------------------------------------------------------

class Mesh::ServiceProvider final
{
public:
    ServiceProvider() = default;

    template<typename Service>
    bool Register(std::shared_ptr<Service> const& spService);

    template<typename Service>
    [[nodiscard]] bool Contains() const;

    template<typename Service>
    [[nodiscard]] std::weak_ptr<Service> Fetch() const;

    [[nodiscard]] std::size_t Size() const;

private:
    std::unordered_map<std::type_index, std::any> m_services;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Mesh::ServiceProvider::Register(std::shared_ptr<Service> const& spService)
{
    if (!spService) { return false; }
    m_services.insert_or_assign(typeid(Service), std::weak_ptr<Service>{ spService });
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Mesh::ServiceProvider::Contains() const { return m_services.contains(typeid(Service)); }

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
std::weak_ptr<Service> Mesh::ServiceProvider::Fetch() const
{
    if (auto const itr = m_services.find(typeid(Service)); itr != m_services.end()) {
        auto const& [key, store] = *itr;
        return std::any_cast<std::weak_ptr<Service>>(store);
    }

    return std::weak_ptr<Service>{};
}

//----------------------------------------------------------------------------------------------------------------------

inline std::size_t Mesh::ServiceProvider::Size() const { return m_services.size(); }

//----------------------------------------------------------------------------------------------------------------------
