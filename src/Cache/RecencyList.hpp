#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace Cache {

// Doubly-linked list of keys, ordered from most (head) to least (tail) recently used.
//
// The list owns node storage: an arena of slots addressed by Handle. Handles stay
// valid while the arena grows. Releasing a slot bumps its generation, so a handle
// kept past release() is rejected instead of silently aliasing the next node
// allocated in the same slot.
//
// Not thread safe.
template <typename Key>
class RecencyList {
    static constexpr uint32_t NIL = UINT32_MAX;
    static constexpr uint32_t NO_LIST = 0;

    struct Node {
        std::optional<Key> key;   // empty <=> slot is free
        uint32_t prev = NIL;
        uint32_t next = NIL;      // also chains free slots
        uint32_t owner = NO_LIST; // id of the list the node is attached to
        uint32_t generation = 0;
    };

public:
    using key_type = Key;
    using size_type = std::size_t;

    struct Handle {
        uint32_t list = NO_LIST;
        uint32_t index = NIL;
        uint32_t generation = 0;

        bool valid() const { return list != NO_LIST && index != NIL; }
        bool operator==(const Handle&) const = default;
    };

    // walks the live list, head to tail
    class const_iterator {
        public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Key;
        using difference_type = std::ptrdiff_t;
        using pointer = const Key*;
        using reference = const Key&;

        const_iterator() = default;

        reference operator*() const { return *m_list->m_nodes[m_index].key; }
        pointer operator->() const { return &**this; }

        const_iterator& operator++() {
            m_index = m_list->m_nodes[m_index].next;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator prev = *this;
            ++*this;
            return prev;
        }

        bool operator==(const const_iterator& other) const { return m_index == other.m_index; }

        private:
        friend class RecencyList;
        const_iterator(const RecencyList* list, uint32_t index) : m_list(list), m_index(index) {}

        const RecencyList* m_list = nullptr;
        uint32_t m_index = NIL;
    };

    RecencyList() : m_id(next_list_id()) {}

    // copying would duplicate the list id, and with it every outstanding handle
    RecencyList(const RecencyList&) = delete;
    RecencyList& operator=(const RecencyList&) = delete;

    RecencyList(RecencyList&& other) noexcept
        : m_id(other.m_id), m_nodes(std::move(other.m_nodes)),
          m_head(other.m_head), m_tail(other.m_tail), m_free(other.m_free), m_count(other.m_count)
    {
        other.reset_moved_from();
    }

    RecencyList& operator=(RecencyList&& other) noexcept {
        if (this != &other) {
            m_id = other.m_id;
            m_nodes = std::move(other.m_nodes);
            m_head = other.m_head;
            m_tail = other.m_tail;
            m_free = other.m_free;
            m_count = other.m_count;
            other.reset_moved_from();
        }
        return *this;
    }

    // allocate a detached node holding key
    Handle emplace(key_type key) {
        if (m_free != NIL) {
            uint32_t index = m_free;
            Node& node = m_nodes[index];
            node.key.emplace(std::move(key));
            m_free = node.next;
            node.next = NIL;
            return Handle{m_id, index, node.generation};
        }

        if (m_nodes.size() >= NIL) {
            throw std::length_error("RecencyList: node arena exhausted");
        }
        Node node;
        node.key.emplace(std::move(key));
        m_nodes.push_back(std::move(node));
        return Handle{m_id, static_cast<uint32_t>(m_nodes.size() - 1), 0};
    }

    // destroy a detached node, its handle becomes stale
    void release(Handle h) {
        Node& node = slot(h);
        if (node.owner != NO_LIST) {
            throw InvalidStateError("RecencyList: cannot release an attached node");
        }
        free_slot(h.index);
    }

    void add_first(Handle h) {
        Node& node = slot(h);
        if (node.owner != NO_LIST) {
            throw InvalidStateError("RecencyList: node already belongs to a list");
        }

        node.owner = m_id;
        node.prev = NIL;
        node.next = m_head;
        if (m_head != NIL) {
            m_nodes[m_head].prev = h.index;
        } else {
            m_tail = h.index;
        }
        m_head = h.index;
        m_count++;
    }

    void remove(Handle h) {
        if (slot(h).owner != m_id) {
            throw InvalidStateError("RecencyList: node does not belong to this list");
        }
        unlink(h.index);
    }

    // detach the tail and return it, the node stays allocated until release()
    Handle remove_last() {
        if (m_count == 0) {
            throw InvalidStateError("RecencyList: list is empty");
        }
        uint32_t index = m_tail;
        unlink(index);
        return handle_of(index);
    }

    Handle first() const { return m_head == NIL ? Handle{} : handle_of(m_head); }
    Handle last() const { return m_tail == NIL ? Handle{} : handle_of(m_tail); }

    const key_type& key(Handle h) const { return *slot(h).key; }
    bool is_attached(Handle h) const { return slot(h).owner == m_id; }

    // same as is_attached(), but false instead of throwing for stale or foreign handles
    bool contains(Handle h) const noexcept {
        if (!h.valid() || h.list != m_id || h.index >= m_nodes.size()) {
            return false;
        }
        const Node& node = m_nodes[h.index];
        return node.key && node.generation == h.generation && node.owner == m_id;
    }

    size_type count() const noexcept { return m_count; }
    bool empty() const noexcept { return m_count == 0; }

    // destroy all nodes, every outstanding handle becomes stale
    void clear() {
        m_free = NIL;
        for (size_t i = m_nodes.size(); i-- > 0; ) {
            Node& node = m_nodes[i];
            if (node.key) {
                node.key.reset();
                node.generation++;
            }
            node.owner = NO_LIST;
            node.prev = NIL;
            node.next = m_free;
            m_free = static_cast<uint32_t>(i);
        }
        m_head = m_tail = NIL;
        m_count = 0;
    }

    const_iterator begin() const { return const_iterator(this, m_head); }
    const_iterator end() const { return const_iterator(this, NIL); }

    // verify that both link chains agree with count and that exactly the reachable nodes are owned by us
    bool check_invariants() const {
        size_type n = 0;
        uint32_t prev = NIL;
        for (uint32_t i = m_head; i != NIL; i = m_nodes[i].next) {
            if (i >= m_nodes.size() || n >= m_count) {
                return false;
            }
            const Node& node = m_nodes[i];
            if (!node.key || node.owner != m_id || node.prev != prev) {
                return false;
            }
            prev = i;
            n++;
        }
        if (n != m_count || prev != m_tail) {
            return false;
        }

        n = 0;
        uint32_t next = NIL;
        for (uint32_t i = m_tail; i != NIL; i = m_nodes[i].prev) {
            if (i >= m_nodes.size() || n >= m_count || m_nodes[i].next != next) {
                return false;
            }
            next = i;
            n++;
        }
        if (n != m_count || next != m_head) {
            return false;
        }

        size_type attached = 0;
        for (const Node& node : m_nodes) {
            if (node.owner == m_id) {
                attached++;
            }
        }
        return attached == m_count;
    }

private:
    static uint32_t next_list_id() {
        static std::atomic<uint32_t> s_next_id{1};
        uint32_t id;
        do {
            id = s_next_id.fetch_add(1, std::memory_order_relaxed);
        } while (id == NO_LIST);
        return id;
    }

    const Node& slot(Handle h) const {
        if (!h.valid()) {
            throw InvalidStateError("RecencyList: invalid node handle");
        }
        if (h.list != m_id) {
            throw InvalidStateError("RecencyList: node belongs to another list");
        }
        if (h.index >= m_nodes.size() || m_nodes[h.index].generation != h.generation || !m_nodes[h.index].key) {
            throw InvalidStateError("RecencyList: stale node handle");
        }
        return m_nodes[h.index];
    }

    Node& slot(Handle h) {
        return const_cast<Node&>(static_cast<const RecencyList*>(this)->slot(h));
    }

    Handle handle_of(uint32_t index) const {
        return Handle{m_id, index, m_nodes[index].generation};
    }

    void unlink(uint32_t index) {
        Node& node = m_nodes[index];
        if (node.prev != NIL) {
            m_nodes[node.prev].next = node.next;
        } else {
            m_head = node.next;
        }
        if (node.next != NIL) {
            m_nodes[node.next].prev = node.prev;
        } else {
            m_tail = node.prev;
        }
        node.prev = NIL;
        node.next = NIL;
        node.owner = NO_LIST;
        m_count--;
    }

    void free_slot(uint32_t index) {
        Node& node = m_nodes[index];
        node.key.reset();
        node.generation++;
        node.prev = NIL;
        node.next = m_free;
        m_free = index;
    }

    void reset_moved_from() {
        m_id = next_list_id();
        m_nodes.clear();
        m_head = m_tail = m_free = NIL;
        m_count = 0;
    }

    uint32_t m_id;
    std::vector<Node> m_nodes;
    uint32_t m_head = NIL;
    uint32_t m_tail = NIL;
    uint32_t m_free = NIL;
    size_type m_count = 0;
};

} // namespace Cache
