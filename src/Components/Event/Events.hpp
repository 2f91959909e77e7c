//----------------------------------------------------------------------------------------------------------------------
// File: Events.hpp
// Description: The coordinator's event types. Each event type is a specialization of Event::Message that stores the
// content forwarded to subscribers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Asset/AssetTypes.hpp"
#include "Components/Fleet/Topology.hpp"
#include "Components/Identifier/NodeIdentifier.hpp"
#include "Components/Node/NodeInfo.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/facilities/empty.hpp>
#include <boost/preprocessor/facilities/va_opt.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint32_t
{
    NodeJoined,
    NodeLeft,
    NodeFailed,
    PartitionDetected,
    PartitionHealed,
    MigrationStarted,
    MigrationCompleted,
    MigrationFailed,
    ByzantineDetected
};

class IMessage;

// By default, the message constructor is deleted to prevent usage of unspecialized types.
template<Type SpecificType>
class Message { Message() = delete; };

template<Type SpecificType>
concept MessageWithContent = requires { typename Message<SpecificType>::EventContent; };

template<Type SpecificType>
concept MessageWithoutContent = !MessageWithContent<SpecificType>;

[[nodiscard]] std::string_view ToString(Type type);

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::IMessage
{
public:
    virtual ~IMessage() = default;
    virtual Event::Type GetType() = 0;
};

//----------------------------------------------------------------------------------------------------------------------
// Note: The following macros define the boilerplate  types, methods, and variables that should be present in event
// specializations. This breakout is done to provide a decent level of flexibility between the traits as well as
// enable further customization if needed.
//----------------------------------------------------------------------------------------------------------------------

// Converts a callback type into an unqualified content store type (e.g. std::string const& becomes std::string).
#define EVENT_MESSAGE_CONTENT_STORE_TYPES(r, data, i, elem) BOOST_PP_COMMA_IF(i) std::remove_cvref_t<elem>
// Converts a callback type into a named parameter (e.g. std::string const& becomes std::string const& arg_0).
#define EVENT_MESSAGE_CONTENT_STORE_ARGS(r, data, i, elem) BOOST_PP_COMMA_IF(i) elem arg_##i
// Converted a callback type into the name argument (e.g. std::string const& becomes arg_0)
#define EVENT_MESSAGE_CONTENT_STORE_NAMES(r, data, i, elem) BOOST_PP_COMMA_IF(i) arg_##i

// Creates the types, methods, and variables needed to support storing and providing callback content.
#define EVENT_MESSAGE_CONTENT_STORE(...) \
public:\
    using EventContent = std::tuple<\
        BOOST_PP_SEQ_FOR_EACH_I(EVENT_MESSAGE_CONTENT_STORE_TYPES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))>; \
    explicit Message(BOOST_PP_SEQ_FOR_EACH_I(\
        EVENT_MESSAGE_CONTENT_STORE_ARGS, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))) \
        : m_content(std::make_tuple(BOOST_PP_SEQ_FOR_EACH_I( \
            EVENT_MESSAGE_CONTENT_STORE_NAMES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))) {} \
    explicit Message(EventContent&& content) : m_content(std::move(content)) {} \
    auto const& GetContent() const { return m_content; } \
private: \
    EventContent m_content;
#define EVENT_MESSAGE_CONTENT_STORE_EMPTY \
private: \
    using EventContent = void;

// Creates the core types and methods needed to define an event specialization.
#define EVENT_MESSAGE_CORE(type, ...) \
public:\
    using CallbackTrait = std::function<void(__VA_ARGS__)>; \
    static constexpr Event::Type Type = type; \
    Message() = default; \
    ~Message() = default; \
    Message(Message const&) = delete; \
    Message(Message&& ) = default; \
    Message& operator=(Message const&) = delete; \
    Message& operator=(Message&&) = default; \
    virtual Event::Type GetType() override { return Type; } \
    BOOST_PP_VA_OPT((EVENT_MESSAGE_CONTENT_STORE(__VA_ARGS__)), (EVENT_MESSAGE_CONTENT_STORE_EMPTY), __VA_ARGS__)

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the node and the capabilities it registered with.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::NodeJoined> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::NodeJoined, Node::Identifier const&, Node::Capabilities const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the node and the reason it left.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::NodeLeft> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::NodeLeft, Node::Identifier const&, std::string const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the node and the time the failure was observed.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::NodeFailed> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::NodeFailed, Node::Identifier const&, TimeUtils::Timepoint)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The partition that was opened.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PartitionDetected> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PartitionDetected, Fleet::Partition const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The identifier of the partition that healed.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PartitionHealed> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PartitionHealed, std::string const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The asset being moved, the source node, and the target node.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::MigrationStarted> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(
        Event::Type::MigrationStarted, Asset::Identifier const&, Node::Identifier const&, Node::Identifier const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The asset that was moved and the node now hosting it.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::MigrationCompleted> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::MigrationCompleted, Asset::Identifier const&, Node::Identifier const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The asset that could not be moved and a description of the failure.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::MigrationFailed> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::MigrationFailed, Asset::Identifier const&, std::string const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The flagged node and the evidence lines that led to the flag.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ByzantineDetected> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::ByzantineDetected, Node::Identifier const&, std::vector<std::string> const&)
};

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Event::ToString(Type type)
{
    switch (type) {
        case Type::NodeJoined: return "NodeJoined";
        case Type::NodeLeft: return "NodeLeft";
        case Type::NodeFailed: return "NodeFailed";
        case Type::PartitionDetected: return "PartitionDetected";
        case Type::PartitionHealed: return "PartitionHealed";
        case Type::MigrationStarted: return "MigrationStarted";
        case Type::MigrationCompleted: return "MigrationCompleted";
        case Type::MigrationFailed: return "MigrationFailed";
        case Type::ByzantineDetected: return "ByzantineDetected";
    }
    return "Unknown";
}

//----------------------------------------------------------------------------------------------------------------------
