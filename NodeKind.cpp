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

#include "NodeKind.h"

namespace dbus {
namespace deviation {

static const std::array<NodeGrammar, kNumNodeKinds> kGrammar{{
    {NodeKind::ROOT, "node", "root", {}, {NodeKind::INTERFACE}},
    {NodeKind::INTERFACE,
     "interface",
     "interface",
     {"name"},
     {NodeKind::METHOD, NodeKind::SIGNAL, NodeKind::PROPERTY, NodeKind::ANNOTATION}},
    {NodeKind::METHOD, "method", "method", {"name"}, {NodeKind::ARGUMENT, NodeKind::ANNOTATION}},
    {NodeKind::SIGNAL, "signal", "signal", {"name"}, {NodeKind::ARGUMENT, NodeKind::ANNOTATION}},
    {NodeKind::PROPERTY,
     "property",
     "property",
     {"name", "type", "access"},
     {NodeKind::ANNOTATION}},
    {NodeKind::ARGUMENT, "arg", "argument", {"type"}, {NodeKind::ANNOTATION}},
    {NodeKind::ANNOTATION, "annotation", "annotation", {"name", "value"}, {}},
}};

const std::array<NodeGrammar, kNumNodeKinds>& grammarTable() {
    return kGrammar;
}

const NodeGrammar& grammarOf(NodeKind kind) {
    return kGrammar.at(static_cast<size_t>(kind));
}

bool lookupChildKind(NodeKind parent, const std::string& tag, NodeKind* kind) {
    for (NodeKind child : grammarOf(parent).permittedChildren) {
        if (grammarOf(child).tag == tag) {
            *kind = child;
            return true;
        }
    }
    return false;
}

}  // namespace deviation
}  // namespace dbus
