/*
 * Copyright (C) 2017 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef DBUS_DEVIATION_NODE_GROUP_H
#define DBUS_DEVIATION_NODE_GROUP_H

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dbus {
namespace deviation {

// A NodeGroup is a list of Nodes with unique names, in the order they were
// added. A second node with the same name is rejected, never overwritten.
// Node.name must hold the key.
template <typename Node>
struct NodeGroup {
   public:
    using const_iterator = typename std::vector<Node>::const_iterator;

    // Add a node so that the group can be constructed programatically.
    // Return false if a node with the same name exists already.
    bool add(Node&& node) {
        if (!mIndex.emplace(node.name, mNodes.size()).second) {
            return false;
        }
        mNodes.push_back(std::move(node));
        return true;
    }

    // Return nullptr if the node does not exist.
    const Node* get(const std::string& name) const {
        auto it = mIndex.find(name);
        if (it == mIndex.end()) {
            return nullptr;
        }
        return &mNodes[it->second];
    }

    bool has(const std::string& name) const { return mIndex.find(name) != mIndex.end(); }

    size_t size() const { return mNodes.size(); }
    bool empty() const { return mNodes.empty(); }

    // Iterate nodes in the order they were added. Call it as follows:
    // for (const auto& method : interface.methods) { }
    const_iterator begin() const { return mNodes.begin(); }
    const_iterator end() const { return mNodes.end(); }

    // Order matters: groups with the same nodes added in a different order
    // are different.
    bool operator==(const NodeGroup& other) const { return mNodes == other.mNodes; }
    bool operator!=(const NodeGroup& other) const { return !(*this == other); }

   private:
    std::vector<Node> mNodes;
    // name to position in mNodes.
    std::map<std::string, size_t> mIndex;
};

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_NODE_GROUP_H
