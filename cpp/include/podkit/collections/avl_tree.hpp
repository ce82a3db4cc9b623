#pragma once

#include <array>
#include <initializer_list>
#include <type_traits>

#include "podkit/bytes/pod.hpp"
#include "podkit/bytes/pod_cast.hpp"
#include "podkit/collections/layout.hpp"
#include "podkit/core/errors.hpp"

namespace podkit::collections {

    // ========================================================================
    // AVL tree over a fixed node array
    // ========================================================================
    //
    // Layout (byte-exact):
    //   [allocator: 8 bytes][node 1]...[node capacity]
    //   allocator: root, size, capacity, free_list_head, sequence, 3 reserved
    //   node:      [left u8][right u8][height u8][reserved u8][K][V]
    //
    // Node indices are 1-based and 0 is the sentinel, so a tree holds at most
    // 254 nodes. Slots below `sequence` have been handed out at least once;
    // released slots form a list threaded through the height register that
    // always ends at `sequence`, so allocation takes the list head and bumps
    // `sequence` only when the list is empty.

    inline constexpr u32 kAvlMaxCapacity = 254;
    inline constexpr u8 kAvlSentinel = 0;

    struct AvlAllocator {
        enum Field : u8 {
            Root = 0,
            Size = 1,
            Capacity = 2,
            FreeListHead = 3,
            Sequence = 4,
        };

        std::array<u8, 8> fields{};

        [[nodiscard]] constexpr u8 get(Field f) const noexcept { return fields[f]; }
        constexpr void set(Field f, u8 v) noexcept { fields[f] = v; }
    };

    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    struct AvlNode {
        enum Register : u8 {
            Left = 0,
            Right = 1,
            Height = 2,
        };

        std::array<u8, 4> registers{};
        K key;
        V value;
    };

} // namespace podkit::collections

namespace podkit::bytes {
    template <>
    struct pod_traits<podkit::collections::AvlAllocator> {
        static constexpr bool enabled = true;
    };

    template <typename K, typename V>
    struct pod_traits<podkit::collections::AvlNode<K, V>> {
        static constexpr bool enabled = pod_traits<K>::enabled && pod_traits<V>::enabled;
    };
} // namespace podkit::bytes

namespace podkit::collections {

    static_assert(sizeof(AvlAllocator) == 8);
    static_assert(podkit::bytes::Pod<AvlAllocator>);

    // Bytes needed for an allocator plus capacity nodes.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    [[nodiscard]] constexpr u32 avl_data_len(u32 capacity) noexcept {
        return podkit::bytes::pod_size<AvlAllocator> + capacity * podkit::bytes::pod_size<AvlNode<K, V>>;
    }

    namespace detail {
        inline podkit::core::Status avl_status(podkit::core::StatusCode code, u32 aux = 0) noexcept {
            return podkit::core::make_status(podkit::core::StatusDomain::Collections, code, aux);
        }

        // Splits a buffer into allocator and node slots. Trailing bytes that do
        // not make a whole node are ignored.
        template <typename Node, typename Byte>
        [[nodiscard]] podkit::core::Status avl_split(Byte* data, u32 len, u32* slots) noexcept {
            if (data == nullptr && len != 0) {
                return avl_status(podkit::core::StatusCode::Invalid);
            }
            if (len < podkit::bytes::pod_size<AvlAllocator>) {
                return avl_status(podkit::core::StatusCode::OutOfBounds, podkit::bytes::pod_size<AvlAllocator> - len);
            }
            *slots = (len - podkit::bytes::pod_size<AvlAllocator>) / podkit::bytes::pod_size<Node>;
            return podkit::core::ok_status();
        }

        // Header fields only. An all-zero header (sequence 0) is a tree that was
        // never initialized; anything else needs 1 <= free list head <= sequence.
        [[nodiscard]] inline podkit::core::Status avl_check_header(const AvlAllocator& a, u32 slots) noexcept {
            const u32 capacity = a.get(AvlAllocator::Capacity);
            if (capacity > slots || capacity > kAvlMaxCapacity) {
                return avl_status(podkit::core::StatusCode::InvalidRegion, capacity);
            }
            const u32 sequence = a.get(AvlAllocator::Sequence);
            if (a.get(AvlAllocator::Size) > capacity || a.get(AvlAllocator::Root) > capacity || sequence > capacity + 1) {
                return avl_status(podkit::core::StatusCode::InvalidRegion, capacity);
            }
            const u32 free_head = a.get(AvlAllocator::FreeListHead);
            if (sequence == 0) {
                if (capacity != 0 || free_head != 0 || a.get(AvlAllocator::Size) != 0 ||
                    a.get(AvlAllocator::Root) != kAvlSentinel) {
                    return avl_status(podkit::core::StatusCode::InvalidRegion, capacity);
                }
                return podkit::core::ok_status();
            }
            if (free_head == kAvlSentinel || free_head > sequence) {
                return avl_status(podkit::core::StatusCode::InvalidRegion, free_head);
            }
            return podkit::core::ok_status();
        }

        // Walks every child link from the root and the whole free list. Each slot
        // in [1, sequence) must be reached exactly once, either as a tree node or
        // as a free-list entry, and the tree must hold `size` nodes. Once this
        // holds, every index a later insert, remove or rebalance can follow is a
        // handed-out slot within capacity. aux is the offending index.
        template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
        [[nodiscard]] podkit::core::Status avl_check_links(const AvlAllocator& a, const AvlNode<K, V>* nodes) noexcept {
            using Node = AvlNode<K, V>;
            const u32 sequence = a.get(AvlAllocator::Sequence);
            if (sequence == 0) {
                return podkit::core::ok_status();
            }

            std::array<bool, kAvlMaxCapacity + 2> seen{};
            std::array<u8, kAvlMaxCapacity + 1> stack{};
            u32 depth = 0;
            u32 in_tree = 0;
            const u8 root = a.get(AvlAllocator::Root);
            if (root != kAvlSentinel) {
                stack[depth++] = root;
            }
            while (depth > 0) {
                const u8 idx = stack[--depth];
                if (idx >= sequence || seen[idx]) {
                    return avl_status(podkit::core::StatusCode::InvalidRegion, idx);
                }
                seen[idx] = true;
                ++in_tree;
                const Node& n = nodes[idx - 1];
                for (const u8 c : {n.registers[Node::Left], n.registers[Node::Right]}) {
                    if (c == kAvlSentinel) {
                        continue;
                    }
                    if (depth >= stack.size()) {
                        return avl_status(podkit::core::StatusCode::InvalidRegion, c);
                    }
                    stack[depth++] = c;
                }
            }
            if (in_tree != a.get(AvlAllocator::Size)) {
                return avl_status(podkit::core::StatusCode::InvalidRegion, in_tree);
            }

            u32 free_count = 0;
            u32 idx = a.get(AvlAllocator::FreeListHead);
            while (idx != sequence) {
                if (idx == kAvlSentinel || idx > sequence || seen[idx]) {
                    return avl_status(podkit::core::StatusCode::InvalidRegion, idx);
                }
                seen[idx] = true;
                ++free_count;
                idx = nodes[idx - 1].registers[Node::Height];
            }
            if (in_tree + free_count != sequence - 1) {
                return avl_status(podkit::core::StatusCode::InvalidRegion, sequence);
            }
            return podkit::core::ok_status();
        }

        // Read-only walks shared by both tree handles. A child index past the
        // stored capacity is InvalidRegion.
        template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
        [[nodiscard]] podkit::core::Status avl_find(const AvlAllocator& a,
                                                    const AvlNode<K, V>* nodes,
                                                    const K& key,
                                                    u8* out) noexcept {
            using Node = AvlNode<K, V>;
            const u8 capacity = a.get(AvlAllocator::Capacity);
            u8 idx = a.get(AvlAllocator::Root);
            while (idx != kAvlSentinel) {
                if (idx > capacity) {
                    return avl_status(podkit::core::StatusCode::InvalidRegion, idx);
                }
                const Node& n = nodes[idx - 1];
                if (key < n.key) {
                    idx = n.registers[Node::Left];
                } else if (n.key < key) {
                    idx = n.registers[Node::Right];
                } else {
                    break;
                }
            }
            *out = idx;
            return podkit::core::ok_status();
        }

        template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
        [[nodiscard]] podkit::core::Status avl_lowest(const AvlAllocator& a, const AvlNode<K, V>* nodes, K* out) noexcept {
            using Node = AvlNode<K, V>;
            if (out == nullptr) {
                return avl_status(podkit::core::StatusCode::Invalid);
            }
            const u8 capacity = a.get(AvlAllocator::Capacity);
            u8 idx = a.get(AvlAllocator::Root);
            if (idx == kAvlSentinel) {
                return avl_status(podkit::core::StatusCode::NotFound);
            }
            for (;;) {
                if (idx > capacity) {
                    return avl_status(podkit::core::StatusCode::InvalidRegion, idx);
                }
                const u8 left = nodes[idx - 1].registers[Node::Left];
                if (left == kAvlSentinel) {
                    break;
                }
                idx = left;
            }
            *out = nodes[idx - 1].key;
            return podkit::core::ok_status();
        }

        template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
        [[nodiscard]] podkit::core::Status avl_get(const AvlAllocator& a,
                                                   const AvlNode<K, V>* nodes,
                                                   const K& key,
                                                   u8* out) noexcept {
            u8 idx = kAvlSentinel;
            const podkit::core::Status s = avl_find<K, V>(a, nodes, key, &idx);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            if (idx == kAvlSentinel) {
                return avl_status(podkit::core::StatusCode::KeyNotFound);
            }
            *out = idx;
            return podkit::core::ok_status();
        }
    } // namespace detail

    // Read-only handle. Views returned by get() alias the buffer.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    class AvlTree {
    public:
        using Node = AvlNode<K, V>;

        AvlTree() noexcept = default;

        // InvalidRegion unless the header and every link describe one tree plus
        // one free list. Costs one pass over the handed-out slots.
        [[nodiscard]] static podkit::core::Status load(BufferView bytes, AvlTree* out) noexcept {
            if (out == nullptr) {
                return detail::avl_status(podkit::core::StatusCode::Invalid);
            }
            u32 slots = 0;
            podkit::core::Status s = detail::avl_split<Node>(bytes.data, bytes.len, &slots);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            const auto* allocator = reinterpret_cast<const AvlAllocator*>(bytes.data);
            s = detail::avl_check_header(*allocator, slots);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            const auto* nodes = reinterpret_cast<const Node*>(bytes.data + podkit::bytes::pod_size<AvlAllocator>);
            s = detail::avl_check_links<K, V>(*allocator, nodes);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            out->allocator_ = allocator;
            out->nodes_ = nodes;
            return podkit::core::ok_status();
        }

        [[nodiscard]] u32 len() const noexcept { return allocator_->get(AvlAllocator::Size); }
        [[nodiscard]] u32 capacity() const noexcept { return allocator_->get(AvlAllocator::Capacity); }
        [[nodiscard]] bool is_empty() const noexcept { return len() == 0; }
        [[nodiscard]] bool is_full() const noexcept { return len() >= capacity(); }

        [[nodiscard]] podkit::core::Status get(const K& key, const V** out) const noexcept {
            if (out == nullptr) {
                return detail::avl_status(podkit::core::StatusCode::Invalid);
            }
            u8 idx = kAvlSentinel;
            const podkit::core::Status s = detail::avl_get<K, V>(*allocator_, nodes_, key, &idx);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *out = &nodes_[idx - 1].value;
            return podkit::core::ok_status();
        }

        [[nodiscard]] podkit::core::Status contains(const K& key, bool* out) const noexcept {
            if (out == nullptr) {
                return detail::avl_status(podkit::core::StatusCode::Invalid);
            }
            u8 idx = kAvlSentinel;
            const podkit::core::Status s = detail::avl_find<K, V>(*allocator_, nodes_, key, &idx);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *out = idx != kAvlSentinel;
            return podkit::core::ok_status();
        }

        // Smallest key. NotFound when the tree is empty.
        [[nodiscard]] podkit::core::Status lowest(K* out) const noexcept {
            return detail::avl_lowest<K, V>(*allocator_, nodes_, out);
        }

    private:
        const AvlAllocator* allocator_{nullptr};
        const Node* nodes_{nullptr};
    };

    // Writable handle. Holding one means holding the only view of the bytes.
    template <podkit::bytes::PodKey K, podkit::bytes::Pod V>
    class AvlTreeMut {
    public:
        using Node = AvlNode<K, V>;

        AvlTreeMut() noexcept = default;

        // Validates like AvlTree::load. When the buffer holds more node slots
        // than the stored capacity, the capacity is raised to match (at most
        // 254). New slots sit past `sequence`, so no free-list fixup is needed.
        [[nodiscard]] static podkit::core::Status load(BufferMut bytes, AvlTreeMut* out) noexcept {
            if (out == nullptr) {
                return detail::avl_status(podkit::core::StatusCode::Invalid);
            }
            u32 slots = 0;
            podkit::core::Status s = detail::avl_split<Node>(bytes.data, bytes.len, &slots);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            auto* allocator = reinterpret_cast<AvlAllocator*>(bytes.data);
            s = detail::avl_check_header(*allocator, slots);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            auto* nodes = reinterpret_cast<Node*>(bytes.data + podkit::bytes::pod_size<AvlAllocator>);
            s = detail::avl_check_links<K, V>(*allocator, nodes);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            // an all-zero header has never been initialized and stays that way
            const u32 usable = slots < kAvlMaxCapacity ? slots : kAvlMaxCapacity;
            if (allocator->get(AvlAllocator::Sequence) != 0 && allocator->get(AvlAllocator::Capacity) < usable) {
                allocator->set(AvlAllocator::Capacity, static_cast<u8>(usable));
            }
            out->allocator_ = allocator;
            out->nodes_ = nodes;
            out->slots_ = slots;
            return podkit::core::ok_status();
        }

        // Resets the tree to empty with the given capacity.
        [[nodiscard]] podkit::core::Status initialize(u32 capacity) noexcept {
            if (capacity > kAvlMaxCapacity || capacity > slots_) {
                return detail::avl_status(podkit::core::StatusCode::CapacityExceeded, capacity);
            }
            allocator_->fields = {kAvlSentinel, 0, static_cast<u8>(capacity), 1, 1, 0, 0, 0};
            return podkit::core::ok_status();
        }

        [[nodiscard]] u32 len() const noexcept { return allocator_->get(AvlAllocator::Size); }
        [[nodiscard]] u32 capacity() const noexcept { return allocator_->get(AvlAllocator::Capacity); }
        [[nodiscard]] bool is_empty() const noexcept { return len() == 0; }
        [[nodiscard]] bool is_full() const noexcept { return len() >= capacity(); }

        [[nodiscard]] podkit::core::Status get(const K& key, const V** out) const noexcept {
            if (out == nullptr) {
                return detail::avl_status(podkit::core::StatusCode::Invalid);
            }
            u8 idx = kAvlSentinel;
            const podkit::core::Status s = detail::avl_get<K, V>(*allocator_, nodes_, key, &idx);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *out = &nodes_[idx - 1].value;
            return podkit::core::ok_status();
        }

        [[nodiscard]] podkit::core::Status get_mut(const K& key, V** out) noexcept {
            if (out == nullptr) {
                return detail::avl_status(podkit::core::StatusCode::Invalid);
            }
            u8 idx = kAvlSentinel;
            const podkit::core::Status s = detail::avl_get<K, V>(*allocator_, nodes_, key, &idx);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *out = &nodes_[idx - 1].value;
            return podkit::core::ok_status();
        }

        [[nodiscard]] podkit::core::Status contains(const K& key, bool* out) const noexcept {
            if (out == nullptr) {
                return detail::avl_status(podkit::core::StatusCode::Invalid);
            }
            u8 idx = kAvlSentinel;
            const podkit::core::Status s = detail::avl_find<K, V>(*allocator_, nodes_, key, &idx);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            *out = idx != kAvlSentinel;
            return podkit::core::ok_status();
        }

        [[nodiscard]] podkit::core::Status lowest(K* out) const noexcept {
            return detail::avl_lowest<K, V>(*allocator_, nodes_, out);
        }

        // KeyExists if the key is present, CapacityExceeded if the tree is full.
        // node (may be null) receives the index the entry landed in.
        [[nodiscard]] podkit::core::Status insert(const K& key, const V& value, u8* node) noexcept {
            const K k = key;
            const V v = value;
            u8 found = kAvlSentinel;
            const podkit::core::Status s = detail::avl_find<K, V>(*allocator_, nodes_, k, &found);
            if (!podkit::core::is_ok(s)) {
                return s;
            }
            if (found != kAvlSentinel) {
                return detail::avl_status(podkit::core::StatusCode::KeyExists, found);
            }
            if (is_full()) {
                return detail::avl_status(podkit::core::StatusCode::CapacityExceeded, capacity());
            }

            u8 placed = kAvlSentinel;
            const u8 root = insert_at(allocator_->get(AvlAllocator::Root), k, v, &placed);
            allocator_->set(AvlAllocator::Root, root);
            if (node != nullptr) {
                *node = placed;
            }
            return podkit::core::ok_status();
        }

        // KeyNotFound if absent. out may be null to discard the value.
        [[nodiscard]] podkit::core::Status remove(const K& key, V* out) noexcept {
            const K k = key;
            u8 found = kAvlSentinel;
            const podkit::core::Status s = detail::avl_get<K, V>(*allocator_, nodes_, k, &found);
            if (!podkit::core::is_ok(s)) {
                return s;
            }

            u8 removed = kAvlSentinel;
            const u8 root = remove_at(allocator_->get(AvlAllocator::Root), k, &removed);
            allocator_->set(AvlAllocator::Root, root);
            if (out != nullptr) {
                *out = nodes_[removed - 1].value;
            }
            release(removed);
            return podkit::core::ok_status();
        }

    private:
        Node& at(u8 idx) noexcept { return nodes_[idx - 1]; }

        u8 child(u8 idx, typename Node::Register r) noexcept { return at(idx).registers[r]; }

        // Levels in the subtree: 0 for the sentinel, 1 for a leaf.
        u8 levels(u8 idx) noexcept {
            return idx == kAvlSentinel ? 0 : static_cast<u8>(at(idx).registers[Node::Height] + 1);
        }

        void update_height(u8 idx) noexcept {
            const u8 l = levels(child(idx, Node::Left));
            const u8 r = levels(child(idx, Node::Right));
            at(idx).registers[Node::Height] = static_cast<u8>(l > r ? l : r);
        }

        int balance(u8 idx) noexcept {
            return static_cast<int>(levels(child(idx, Node::Left))) - static_cast<int>(levels(child(idx, Node::Right)));
        }

        u8 rotate_right(u8 idx) noexcept {
            const u8 left = child(idx, Node::Left);
            at(idx).registers[Node::Left] = child(left, Node::Right);
            at(left).registers[Node::Right] = idx;
            update_height(idx);
            update_height(left);
            return left;
        }

        u8 rotate_left(u8 idx) noexcept {
            const u8 right = child(idx, Node::Right);
            at(idx).registers[Node::Right] = child(right, Node::Left);
            at(right).registers[Node::Left] = idx;
            update_height(idx);
            update_height(right);
            return right;
        }

        // Restores |balance| <= 1 at idx and returns the subtree's new root.
        u8 rebalance(u8 idx) noexcept {
            update_height(idx);
            const int b = balance(idx);
            if (b > 1) {
                if (balance(child(idx, Node::Left)) < 0) {
                    at(idx).registers[Node::Left] = rotate_left(child(idx, Node::Left));
                }
                return rotate_right(idx);
            }
            if (b < -1) {
                if (balance(child(idx, Node::Right)) > 0) {
                    at(idx).registers[Node::Right] = rotate_right(child(idx, Node::Right));
                }
                return rotate_left(idx);
            }
            return idx;
        }

        u8 allocate(const K& key, const V& value) noexcept {
            const u8 free_node = allocator_->get(AvlAllocator::FreeListHead);
            const u8 sequence = allocator_->get(AvlAllocator::Sequence);
            if (free_node == sequence) {
                allocator_->set(AvlAllocator::Sequence, static_cast<u8>(sequence + 1));
                allocator_->set(AvlAllocator::FreeListHead, static_cast<u8>(sequence + 1));
            } else {
                allocator_->set(AvlAllocator::FreeListHead, at(free_node).registers[Node::Height]);
            }
            Node& n = at(free_node);
            n.registers = {};
            n.key = key;
            n.value = value;
            allocator_->set(AvlAllocator::Size, static_cast<u8>(allocator_->get(AvlAllocator::Size) + 1));
            return free_node;
        }

        void release(u8 idx) noexcept {
            Node& n = at(idx);
            n.key = K{};
            n.value = V{};
            n.registers = {};
            n.registers[Node::Height] = allocator_->get(AvlAllocator::FreeListHead);
            allocator_->set(AvlAllocator::FreeListHead, idx);
            allocator_->set(AvlAllocator::Size, static_cast<u8>(allocator_->get(AvlAllocator::Size) - 1));
        }

        // Depth is bounded by the AVL height of 254 nodes, so recursion is shallow.
        u8 insert_at(u8 idx, const K& key, const V& value, u8* placed) noexcept {
            if (idx == kAvlSentinel) {
                *placed = allocate(key, value);
                return *placed;
            }
            if (key < at(idx).key) {
                const u8 sub = insert_at(child(idx, Node::Left), key, value, placed);
                at(idx).registers[Node::Left] = sub;
            } else {
                const u8 sub = insert_at(child(idx, Node::Right), key, value, placed);
                at(idx).registers[Node::Right] = sub;
            }
            return rebalance(idx);
        }

        // Unlinks the smallest node under idx into *min.
        u8 detach_min(u8 idx, u8* min) noexcept {
            if (child(idx, Node::Left) == kAvlSentinel) {
                *min = idx;
                return child(idx, Node::Right);
            }
            const u8 sub = detach_min(child(idx, Node::Left), min);
            at(idx).registers[Node::Left] = sub;
            return rebalance(idx);
        }

        // The key is known to be present.
        u8 remove_at(u8 idx, const K& key, u8* removed) noexcept {
            if (key < at(idx).key) {
                const u8 sub = remove_at(child(idx, Node::Left), key, removed);
                at(idx).registers[Node::Left] = sub;
                return rebalance(idx);
            }
            if (at(idx).key < key) {
                const u8 sub = remove_at(child(idx, Node::Right), key, removed);
                at(idx).registers[Node::Right] = sub;
                return rebalance(idx);
            }
            *removed = idx;
            const u8 left = child(idx, Node::Left);
            const u8 right = child(idx, Node::Right);
            if (left == kAvlSentinel) {
                return right;
            }
            if (right == kAvlSentinel) {
                return left;
            }
            u8 successor = kAvlSentinel;
            const u8 rest = detach_min(right, &successor);
            at(successor).registers[Node::Left] = left;
            at(successor).registers[Node::Right] = rest;
            return rebalance(successor);
        }

        AvlAllocator* allocator_{nullptr};
        Node* nodes_{nullptr};
        u32 slots_{0};
    };

} // namespace podkit::collections
