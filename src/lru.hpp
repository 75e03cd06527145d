/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "lru.h"
#include <memory>

namespace textvault {

    template< typename IdType, typename CachedObjectType >
    void LRUCache<IdType, CachedObjectType>::unlink(Node* node) {
        if (node->prev) {
            node->prev->next = node->next;
        } else {
            // This was the first node
            _first = node->next;
        }

        if (node->next) {
            node->next->prev = node->prev;
        } else {
            // This was the last node
            _last = node->prev;
        }

        node->next = nullptr;
        node->prev = nullptr;
    }

    template< typename IdType, typename CachedObjectType >
    void LRUCache<IdType, CachedObjectType>::pushFront(Node* node) {
        node->prev = nullptr;
        node->next = _first;
        if (_first) {
            _first->prev = node;
        }
        _first = node;
        if (!_last) {
            _last = node;
        }
    }

    template< typename IdType, typename CachedObjectType >
    CachedObjectType* LRUCache<IdType, CachedObjectType>::get(const IdType &id) {
        auto it = _nodes.find(id);
        if (it == _nodes.end()) {
            return nullptr;
        }

        Node* node = it->second;
        if (node != _first) {
            unlink(node);
            pushFront(node);
        }
        return &node->object;
    }

    template< typename IdType, typename CachedObjectType >
    const CachedObjectType* LRUCache<IdType, CachedObjectType>::peek(const IdType &id) const {
        auto it = _nodes.find(id);
        return it == _nodes.end() ? nullptr : &it->second->object;
    }

    /**
     * Adds a node to the head of the cache list, evicting from the tail
     * when over capacity
     */
    template< typename IdType, typename CachedObjectType >
    std::optional<IdType> LRUCache<IdType, CachedObjectType>::add(const IdType &id, CachedObjectType object) {
        auto it = _nodes.find(id);
        if (it != _nodes.end()) {
            Node* node = it->second;
            node->object = std::move(object);
            if (node != _first) {
                unlink(node);
                pushFront(node);
            }
            return std::nullopt;
        }

        // index first so a failed insert leaves the list untouched
        std::unique_ptr<Node> node(new Node(id, std::move(object), nullptr));
        _nodes.emplace(id, node.get());
        pushFront(node.release());

        if (_nodes.size() > _maxEntries) {
            return removeOne();
        }
        return std::nullopt;
    }

    /**
     * Removes the LRU node
     */
    template< typename IdType, typename CachedObjectType >
    std::optional<IdType> LRUCache<IdType, CachedObjectType>::removeOne() {
        if (!_last) {
            return std::nullopt;
        }

        Node* node = _last;
        IdType id = node->id;
        unlink(node);
        _nodes.erase(id);
        delete node;
        return id;
    }

    template< typename IdType, typename CachedObjectType >
    bool LRUCache<IdType, CachedObjectType>::remove(const IdType &id) {
        auto it = _nodes.find(id);
        if (it == _nodes.end()) {
            return false;
        }

        Node* node = it->second;
        unlink(node);
        _nodes.erase(it);
        delete node;
        return true;
    }

    /**
     * Clears all nodes from the cache, deleting all cached objects.
     */
    template< typename IdType, typename CachedObjectType >
    void LRUCache<IdType, CachedObjectType>::clear() {
        Node* n = _first;
        while (n) {
            Node* next = n->next;
            delete n;
            n = next;
        }
        _nodes.clear();
        _first = nullptr;
        _last = nullptr;
    }

    template< typename IdType, typename CachedObjectType >
    void LRUCache<IdType, CachedObjectType>::updateMaxEntries(sizeType maxEntries) {
        _maxEntries = maxEntries;
        while (_nodes.size() > _maxEntries) {
            removeOne();
        }
    }

    template< typename IdType, typename CachedObjectType >
    std::vector<IdType> LRUCache<IdType, CachedObjectType>::ids() const {
        std::vector<IdType> out;
        out.reserve(_nodes.size());
        for (Node* n = _last; n; n = n->prev) {
            out.push_back(n->id);
        }
        return out;
    }

}
