#pragma once

#include <vector>

class UnionFind {
public:
    explicit UnionFind(int n);
    int find(int x);
    // Returns false when x and y were already in the same set.
    bool unite(int x, int y);
    int size() const { return static_cast<int>(parent.size()); }

private:
    std::vector<int> parent;
    std::vector<int> rank;
};

// Connected components, each listed in ascending index order and the
// components ordered by their smallest index.
std::vector<std::vector<int>> collectComponents(UnionFind& uf);
