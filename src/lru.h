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

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace textvault {

    /**
     * Node of the recency list. The cache owns the node and the value it
     * carries.
     */
    template< typename IdType, typename CachedObjectType >
    struct LRUCacheNode {

        typedef LRUCacheNode<IdType, CachedObjectType> _SelfType;

        LRUCacheNode(const IdType &i, CachedObjectType o, _SelfType *n)
                : id(i), object(std::move(o)), next(n), prev(nullptr) {}

        IdType id;
        CachedObjectType object;

        // linked list of cache nodes, most recently used first
        _SelfType *next;
        _SelfType *prev;
    };

    /**
     * Entry-bounded LRU cache. The recency list and the id index are one
     * structure: every indexed id has exactly one list node and vice versa.
     * Not thread-safe; callers hold their own lock.
     */
    template< typename IdType, typename CachedObjectType >
    class LRUCache {
    public:
        typedef size_t sizeType;
        typedef LRUCacheNode<IdType, CachedObjectType> Node;
        typedef std::unordered_map<IdType, Node*> NodeIndex;

        explicit LRUCache(const sizeType &maxEntries)
                : _first(nullptr), _last(nullptr), _maxEntries(maxEntries) {}

        LRUCache(const LRUCache&) = delete;
        LRUCache& operator=(const LRUCache&) = delete;

        ~LRUCache() { clear(); }

        sizeType getMaxEntries() const { return _maxEntries; }

        /**
         * Shrinking below the current size evicts from the LRU end.
         */
        void updateMaxEntries(sizeType maxEntries);

        /**
         * Gets an item by id and marks it most recently used.
         * Returns nullptr on a miss.
         */
        CachedObjectType* get(const IdType &id);

        /**
         * Gets an item by id without touching recency.
         */
        const CachedObjectType* peek(const IdType &id) const;

        bool contains(const IdType &id) const { return _nodes.find(id) != _nodes.end(); }

        /**
         * Adds (or replaces) an item as most recently used.
         * @return the id evicted to stay within capacity, if any
         */
        std::optional<IdType> add(const IdType &id, CachedObjectType object);

        /**
         * Removes the least recently used node.
         * @return its id, or nullopt when empty
         */
        std::optional<IdType> removeOne();

        bool remove(const IdType &id);

        void clear();

        sizeType size() const { return _nodes.size(); }
        bool empty() const { return _nodes.empty(); }

        /**
         * Ids from least to most recently used.
         */
        std::vector<IdType> ids() const;

    private:
        void unlink(Node* node);
        void pushFront(Node* node);

        // facilitate easy lookup by ID
        NodeIndex _nodes;

        // facilitate order by LRU
        Node* _first;
        Node* _last;

        sizeType _maxEntries;
    };

}

#include "lru.hpp"
