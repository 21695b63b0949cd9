#pragma once

#include "ecs/Entity.hpp"

#include <algorithm>
#include <unordered_set>
#include <vector>

namespace spectral {

/// Live enemy handles in spawn order. Membership tests are O(1); iteration
/// visits the oldest enemy first, which limit enforcement relies on.
class ActiveEnemySet {
public:
    /// @return false if already present
    bool insert(Entity entity) {
        if (!m_members.insert(entity).second) return false;
        m_order.push_back(entity);
        return true;
    }

    /// @return false if not present
    bool erase(Entity entity) {
        if (m_members.erase(entity) == 0) return false;
        m_order.erase(std::remove(m_order.begin(), m_order.end(), entity), m_order.end());
        return true;
    }

    bool contains(Entity entity) const { return m_members.count(entity) > 0; }
    size_t size() const { return m_order.size(); }
    bool empty() const { return m_order.empty(); }

    /// Oldest member, or NullEntity when empty
    Entity oldest() const { return m_order.empty() ? NullEntity : m_order.front(); }

    /// Snapshot in insertion order, safe to iterate while mutating the set
    std::vector<Entity> snapshot() const { return m_order; }

    std::vector<Entity>::const_iterator begin() const { return m_order.begin(); }
    std::vector<Entity>::const_iterator end() const { return m_order.end(); }

    void clear() {
        m_members.clear();
        m_order.clear();
    }

private:
    std::unordered_set<Entity> m_members;
    std::vector<Entity> m_order;
};

} // namespace spectral
