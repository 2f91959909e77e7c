//----------------------------------------------------------------------------------------------------------------------
// File: ByzantineDetector.hpp
// Description: Flags nodes whose reports about shared assets contradict the majority of the other observers. Flags
// are advisory, a flagged node is marked suspected until a later evaluation clears it and is never removed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Publisher.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/logger.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace Asset { class StateStore; }
namespace Mesh { class ServiceProvider; }
namespace Node { class Registry; }

//----------------------------------------------------------------------------------------------------------------------
namespace Fleet {
//----------------------------------------------------------------------------------------------------------------------

struct Assessment;

class ByzantineDetector;

//----------------------------------------------------------------------------------------------------------------------
} // Fleet namespace
//----------------------------------------------------------------------------------------------------------------------

struct Fleet::Assessment
{
    Node::Identifier node;
    std::uint32_t suspicious = 0;
    std::uint32_t observed = 0;
    double ratio = 0.0;
    bool flagged = false;
    std::vector<std::string> evidence;
};

//----------------------------------------------------------------------------------------------------------------------

class Fleet::ByzantineDetector final
{
public:
    static constexpr double MinimumSuccessRate = 0.5;

    ByzantineDetector(std::shared_ptr<Mesh::ServiceProvider> const& spServiceProvider, double threshold);

    ByzantineDetector(ByzantineDetector const&) = delete;
    ByzantineDetector& operator=(ByzantineDetector const&) = delete;

    // A node is flagged when its ratio of suspicious behaviors to observed assets is strictly greater than the
    // threshold. Failed nodes are not assessed.
    std::vector<Assessment> Evaluate();

    [[nodiscard]] double GetThreshold() const;

private:
    std::shared_ptr<Node::Registry> m_spRegistry;
    std::shared_ptr<Asset::StateStore> m_spStateStore;
    Event::SharedPublisher m_spEventPublisher;
    std::shared_ptr<spdlog::logger> m_logger;
    double const m_threshold;
};

//----------------------------------------------------------------------------------------------------------------------
