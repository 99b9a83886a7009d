#include "UnionFind.h"
#include <algorithm>
#include <unordered_map>

UnionFind::UnionFind(int n)
    : parent(n)
    , rank(n, 0)
{
    for (int i = 0; i < n; ++i)
        parent[i] = i;
}

int UnionFind::find(int x)
{
    if (parent[x] != x)
        parent[x] = find(parent[x]);
    return parent[x];
}

bool UnionFind::unite(int x, int y)
{
    int rx = find(x), ry = find(y);
    if (rx == ry)
        return false;
    if (rank[rx] < rank[ry])
        std::swap(rx, ry);
    parent[ry] = rx;
    if (rank[rx] == rank[ry])
        rank[rx]++;
    return true;
}

std::vector<std::vector<int>> collectComponents(UnionFind& uf)
{
    int const n = uf.size();

    // root -> position in `groups`; first sighting is the smallest member
    std::unordered_map<int, std::size_t> slot;
    slot.reserve(n);
    std::vector<std::vector<int>> groups;
    for (int i = 0; i < n; ++i) {
        int r = uf.find(i);
        auto [it, inserted] = slot.try_emplace(r, groups.size());
        if (inserted)
            groups.emplace_back();
        groups[it->second].push_back(i);
    }
    return groups;
}
