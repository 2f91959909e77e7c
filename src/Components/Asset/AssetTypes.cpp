//----------------------------------------------------------------------------------------------------------------------
// File: AssetTypes.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "AssetTypes.hpp"
#include "Utilities/CryptoUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/container_hash/hash.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <tuple>
//----------------------------------------------------------------------------------------------------------------------

std::optional<Asset::Identifier> Asset::GenerateIdentifier(Type type)
{
    IdentifierBytes bytes{ 0 };
    if (!CryptoUtils::FillRandom(bytes)) { return {}; }
    return Identifier{ bytes, type };
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Asset::ToString(Type type)
{
    switch (type) {
        case Type::Cpu: return "cpu";
        case Type::Gpu: return "gpu";
        case Type::Memory: return "memory";
        case Type::Storage: return "storage";
        case Type::Network: return "network";
        case Type::Container: return "container";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Asset::ToString(Status status)
{
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Allocated: return "allocated";
        case Status::Active: return "active";
        case Status::Migrating: return "migrating";
        case Status::Suspended: return "suspended";
        case Status::Released: return "released";
        case Status::Failed: return "failed";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

Asset::Identifier::Identifier()
    : m_bytes{ 0 }
    , m_type(Type::Cpu)
{
}

//----------------------------------------------------------------------------------------------------------------------

Asset::Identifier::Identifier(IdentifierBytes const& bytes, Type type)
    : m_bytes(bytes)
    , m_type(type)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Asset::Identifier::operator==(Identifier const& other) const
{
    return m_bytes == other.m_bytes && m_type == other.m_type;
}

//----------------------------------------------------------------------------------------------------------------------

bool Asset::Identifier::operator!=(Identifier const& other) const { return !operator==(other); }

//----------------------------------------------------------------------------------------------------------------------

bool Asset::Identifier::operator<(Identifier const& other) const
{
    return std::tie(m_bytes, m_type) < std::tie(other.m_bytes, other.m_type);
}

//----------------------------------------------------------------------------------------------------------------------

Asset::IdentifierBytes const& Asset::Identifier::GetBytes() const { return m_bytes; }

//----------------------------------------------------------------------------------------------------------------------

Asset::Type Asset::Identifier::GetType() const { return m_type; }

//----------------------------------------------------------------------------------------------------------------------

std::string Asset::Identifier::ToString() const { return CryptoUtils::ToHex(m_bytes); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Asset::Hasher::operator()(Identifier const& identifier) const
{
    auto const& bytes = identifier.GetBytes();
    std::size_t seed = boost::hash_range(bytes.begin(), bytes.end());
    boost::hash_combine(seed, static_cast<std::uint8_t>(identifier.GetType()));
    return seed;
}

//----------------------------------------------------------------------------------------------------------------------
