/******************************************************************************
 * Copyright (C) 2017 Kitsune Ral <kitsune-ral@users.sf.net>
 * Copyright (C) 2026 insogen contributors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#pragma once

#include "util.h"

#include <yaml-cpp/node/convert.h>
#include <yaml-cpp/node/detail/impl.h>
#include <yaml-cpp/node/iterator.h>
#include <yaml-cpp/node/node.h>

#include <memory>
#include <string>
#include <string_view>

class YamlNode;

struct YamlException : Exception {
    explicit YamlException(const YamlNode& node, std::string_view msg) noexcept;
};

template <YAML::NodeType::value NodeTypeV, typename KeyT, typename ItemT>
class YamlContainer;

template <typename ItemT = YamlNode>
using YamlMap = YamlContainer<YAML::NodeType::Map, std::string, ItemT>;

template <typename ItemT = YamlNode>
using YamlSequence = YamlContainer<YAML::NodeType::Sequence, size_t, ItemT>;

//! \brief A YAML::Node that remembers which file it came from
//!
//! All diagnostics produced from the API description or the configuration
//! refer to the source through location(), so the file name travels along
//! with every node obtained from the root, including container elements.
class YamlNode : public YAML::Node {
public:
    struct Context {
        std::string fileName;
    };
    // Templated to prevent accidental construction from YamlNode and descendants
    template <class NodeT = YAML::Node>
        requires std::is_same_v<std::decay_t<NodeT>, YAML::Node>
    YamlNode(const NodeT& n = {}, std::shared_ptr<Context> context = {})
        : YamlNode(n, context ? context : std::make_shared<Context>(), AllowUndefined{})
    {
        Mark(); // Throw YAML::InvalidNode if n is invalid
    }
    static YamlNode fromFile(const std::string& fileName);
    static YamlNode fromString(const std::string& text, std::string sourceName = "(inline)");

    const std::string& fileName() const { return _context->fileName; }
    std::string location() const
    {
        return fileName() + ':' + std::to_string(Mark().line + 1);
    }

    bool empty() const { return !IsDefined() || size() == 0; }

    //! Whether the node is a scalar written in quotes (a JSON string)
    bool isQuotedScalar() const { return IsScalar() && Tag() == "!"; }

    template <typename T>
    T as() const
    {
        if constexpr (std::is_base_of_v<YamlNode, T>) {
            // Containers check the node type in their constructor
            return T(*this);
        } else {
            using NonConstT = std::remove_const_t<T>;
            // YAML::convert<> doesn't expose the node type it expects; encoding
            // a default value reveals it well enough for stock yaml-cpp types
            static const auto ExpectedNodeType = YAML::convert<NonConstT>::encode({}).Type();
            checkType(ExpectedNodeType);
            return Node::as<NonConstT>();
        }
    }

    void begin() const = delete;
    void begin() = delete;
    void end() const = delete;
    void end() = delete;

protected:
    struct AllowUndefined {};

    YamlNode(const Node& rhs, std::shared_ptr<Context> context, AllowUndefined)
        : Node(rhs), _context(std::move(context))
    {}

    template <typename T>
    static T as(const Node& rhs, std::shared_ptr<Context> context)
    {
        return YamlNode(rhs, context, AllowUndefined{}).template as<T>();
    }

    void checkType(YAML::NodeType::value checkedType) const;

    std::shared_ptr<Context> _context;

    template <class ContainerT>
    friend class iterator_base;
};

//! A possibly undefined YamlNode; dereferencing an undefined one throws
template <std::derived_from<YamlNode> NodeT>
class Optional : private NodeT {
public:
    Optional(const YAML::Node& rhs, std::shared_ptr<YamlNode::Context> context)
        : NodeT(rhs, std::move(context), YamlNode::AllowUndefined{})
    {}

    using YamlNode::fileName, YamlNode::location, YamlNode::empty;
    using YAML::Node::operator bool, YAML::Node::operator!;

    const NodeT& operator*() const
    {
        YAML::Node::Mark(); // Throws if the node is undefined
        return *this;
    }
    const NodeT* operator->() const { return NodeT::IsDefined() ? this : nullptr; }
};

// Follows yaml-cpp's own iterator but carries the context along so that
// elements are YamlNodes with a proper location
template <class ContainerT>
class iterator_base {
public:
    using this_type = iterator_base<ContainerT>;
    using value_type = typename ContainerT::value_type;

private:
    using iter_impl_t = YAML::detail::iterator_base<const YAML::detail::iterator_value>;
    friend ContainerT;

    iterator_base(iter_impl_t iter, std::shared_ptr<YamlNode::Context> context)
        : _impl(std::move(iter)), _context(std::move(context))
    {}

public:
    this_type& operator++()
    {
        ++_impl;
        return *this;
    }

    bool operator==(const this_type& rhs) const { return _impl == rhs._impl; }

    value_type operator*() const
    {
        if constexpr (ContainerT::nodeType == YAML::NodeType::Sequence)
            return YamlNode::as<value_type>(*_impl, _context);
        else
            return std::pair{
                YamlNode::as<typename value_type::first_type>(_impl->first, _context),
                YamlNode::as<typename value_type::second_type>(_impl->second, _context)};
    }

private:
    iter_impl_t _impl;
    std::shared_ptr<YamlNode::Context> _context;
};

template <YAML::NodeType::value NodeTypeV, typename KeyT, typename ItemT>
class YamlContainer : public YamlNode {
public:
    using this_type = YamlContainer<NodeTypeV, KeyT, ItemT>;
    static constexpr auto nodeType = NodeTypeV;
    static_assert(nodeType == YAML::NodeType::Sequence || nodeType == YAML::NodeType::Map);

    using mapped_type = ItemT;
    using value_type =
        std::conditional_t<nodeType == YAML::NodeType::Map, std::pair<KeyT, ItemT>, ItemT>;
    using const_iterator = iterator_base<const this_type>;

    explicit YamlContainer(const YamlNode& yn) : YamlNode(yn) { checkType(nodeType); }

    const_iterator begin() const { return const_iterator(Node::begin(), this->_context); }
    const_iterator end() const { return const_iterator(Node::end(), this->_context); }

    template <std::derived_from<YamlNode> AsT = mapped_type>
    Optional<AsT> maybeGet(const KeyT& key) const
    {
        return Optional<AsT>(Node::operator[](key), _context);
    }

    auto operator[](const KeyT& key) const { return maybeGet(key); }

    //! Assigns the value at \p key to \p target if the key exists
    template <typename TargetT>
    bool maybeLoad(const KeyT& key, TargetT* target) const
    {
        const auto& subnode = Node::operator[](key);
        if (!subnode.IsDefined())
            return false;
        *target = YamlNode::as<TargetT>(subnode, _context);
        return true;
    }

protected:
    explicit YamlContainer(const YAML::Node& n, std::shared_ptr<Context> context, AllowUndefined)
        : YamlNode(n, context, AllowUndefined{})
    {
        if (IsDefined() && Type() != YAML::NodeType::Null) // Null is treated as empty container
            checkType(nodeType);
    }
};

//! \brief Unescape a single JSON Pointer reference token (RFC 6901)
//!
//! Turns `~1` into `/` and `~0` into `~`; throws Exception on any other
//! character following `~`.
std::string unescapeJsonPointerComponent(std::string_view escapedComponent);
