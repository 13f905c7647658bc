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

#ifndef DBUS_DEVIATION_NODE_KIND_H
#define DBUS_DEVIATION_NODE_KIND_H

#include <array>
#include <string>
#include <vector>

namespace dbus {
namespace deviation {

// Structural element kinds of an introspection document. ROOT is the
// interface-set element (<node>).
enum class NodeKind : size_t {
    ROOT = 0,
    INTERFACE,
    METHOD,
    SIGNAL,
    PROPERTY,
    ARGUMENT,
    ANNOTATION,
};

static constexpr size_t kNumNodeKinds = 7;

// Grammar of one node kind. Documentation elements are permitted under every
// kind and are not listed in permittedChildren.
struct NodeGrammar {
    NodeKind kind;
    // Element tag, e.g. "arg". Used in missing-attribute messages.
    std::string tag;
    // Human readable kind, e.g. "argument". Used in unknown-node contexts.
    std::string displayName;
    // Checked in order; all of them are checked against the same element.
    std::vector<std::string> requiredAttributes;
    std::vector<NodeKind> permittedChildren;
};

const NodeGrammar& grammarOf(NodeKind kind);

// All grammar rows, indexed by NodeKind.
const std::array<NodeGrammar, kNumNodeKinds>& grammarTable();

// Return true and set kind if tag names a structural element permitted under
// parent.
bool lookupChildKind(NodeKind parent, const std::string& tag, NodeKind* kind);

}  // namespace deviation
}  // namespace dbus

#endif  // DBUS_DEVIATION_NODE_KIND_H
