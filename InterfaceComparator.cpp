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

#define LOG_TAG "libdeviation"
#include <android-base/logging.h>

#include "InterfaceComparator.h"

#include <algorithm>
#include <iterator>

#include "parse_string.h"

namespace dbus {
namespace deviation {

namespace {

struct EmitsChangedSignalTransition {
    std::string oldValue;
    std::string newValue;
    Severity severity;
    // Completes "Node 'X' ..."
    std::string description;
};

const std::string kPropertiesChanged = "org.freedesktop.DBus.PropertiesChanged";

// Changes of org.freedesktop.DBus.Property.EmitsChangedSignal. Transitions not
// listed here, e.g. true -> const, are not reported.
const std::vector<EmitsChangedSignalTransition> kEmitsChangedSignalTransitions = {
    {"true", "false", Severity::FORWARDS_INCOMPATIBLE, "stopped emitting " + kPropertiesChanged},
    {"true", "const", Severity::FORWARDS_INCOMPATIBLE, "stopped emitting " + kPropertiesChanged},
    {"invalidates", "false", Severity::FORWARDS_INCOMPATIBLE,
     "stopped emitting " + kPropertiesChanged},
    {"invalidates", "const", Severity::FORWARDS_INCOMPATIBLE,
     "stopped emitting " + kPropertiesChanged},
    {"false", "true", Severity::BACKWARDS_INCOMPATIBLE, "started emitting " + kPropertiesChanged},
    {"false", "invalidates", Severity::BACKWARDS_INCOMPATIBLE,
     "started emitting " + kPropertiesChanged},
    {"const", "true", Severity::BACKWARDS_INCOMPATIBLE, "started emitting " + kPropertiesChanged},
    {"const", "invalidates", Severity::BACKWARDS_INCOMPATIBLE,
     "started emitting " + kPropertiesChanged},
    {"true", "invalidates", Severity::BACKWARDS_INCOMPATIBLE,
     "stopped emitting its new value in " + kPropertiesChanged},
    {"invalidates", "true", Severity::BACKWARDS_INCOMPATIBLE,
     "started emitting its new value in " + kPropertiesChanged},
    {"const", "false", Severity::BACKWARDS_INCOMPATIBLE, "stopped being a constant"},
    {"false", "const", Severity::FORWARDS_INCOMPATIBLE, "became a constant"},
};

// A property without its own annotation takes the one of its declaring
// interface. Anything else defaults to "true".
std::string getEmitsChangedSignal(const Node& node, const Interface* declaringInterface) {
    const Annotation* annotation = node.getAnnotation(kEmitsChangedSignalAnnotation);
    if (annotation != nullptr) {
        return annotation->value;
    }
    if (declaringInterface != nullptr) {
        return getEmitsChangedSignal(*declaringInterface, nullptr);
    }
    return "true";
}

std::string quote(const std::string& s) {
    return "'" + s + "'";
}

}  // anonymous namespace

bool operator==(const Difference& lft, const Difference& rgt) {
    return lft.severity == rgt.severity && lft.message == rgt.message;
}

InterfaceComparator::InterfaceComparator(const InterfaceMap& oldInterfaces,
                                         const InterfaceMap& newInterfaces)
    : mOldInterfaces(oldInterfaces), mNewInterfaces(newInterfaces) {}

void InterfaceComparator::issueOutput(Severity severity, const std::string& message) {
    mOutput.push_back(Difference{severity, message});
}

std::vector<Difference> InterfaceComparator::getOutput(const WarningFlags& flags) const {
    std::vector<Difference> out;
    std::copy_if(mOutput.begin(), mOutput.end(), std::back_inserter(out),
                 [&flags](const Difference& d) { return flags.isEnabled(d.severity); });
    return out;
}

bool InterfaceComparator::hasOutput(Severity severity, const WarningFlags& flags) const {
    if (!flags.isEnabled(severity)) {
        return false;
    }
    return std::any_of(mOutput.begin(), mOutput.end(),
                       [severity](const Difference& d) { return d.severity == severity; });
}

const std::vector<Difference>& InterfaceComparator::compare() {
    mOutput.clear();

    for (const auto& interface : mOldInterfaces) {
        const Interface* newInterface = mNewInterfaces.get(interface.name);
        if (newInterface == nullptr) {
            issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                        "Interface " + quote(interface.name) + " has been removed.");
        } else {
            compareInterfaces(interface, *newInterface);
        }
    }

    for (const auto& interface : mNewInterfaces) {
        if (!mOldInterfaces.has(interface.name)) {
            issueOutput(Severity::FORWARDS_INCOMPATIBLE,
                        "Interface " + quote(interface.name) + " has been added.");
        }
    }

    LOG(DEBUG) << "Compared " << mOldInterfaces.size() << " old and " << mNewInterfaces.size()
               << " new interfaces: " << mOutput.size() << " differences.";
    return mOutput;
}

template <typename T>
void InterfaceComparator::compareAnnotations(const T& oldNode, const T& newNode,
                                             const Interface* oldInterface,
                                             const Interface* newInterface) {
    const std::string name = quote(oldNode.formatName());

    bool oldDeprecated = oldNode.getBoolAnnotation(kDeprecatedAnnotation, false);
    bool newDeprecated = newNode.getBoolAnnotation(kDeprecatedAnnotation, false);
    if (oldDeprecated && !newDeprecated) {
        issueOutput(Severity::INFO, "Node " + name + " has been un-deprecated.");
    } else if (!oldDeprecated && newDeprecated) {
        issueOutput(Severity::INFO, "Node " + name + " has been deprecated.");
    }

    std::string oldCSymbol = oldNode.getStringAnnotation(kCSymbolAnnotation, "");
    std::string newCSymbol = newNode.getStringAnnotation(kCSymbolAnnotation, "");
    if (oldCSymbol != newCSymbol) {
        issueOutput(Severity::INFO, "Node " + name + " has changed its C symbol from " +
                                        quote(oldCSymbol) + " to " + quote(newCSymbol) + ".");
    }

    bool oldNoReply = oldNode.getBoolAnnotation(kNoReplyAnnotation, false);
    bool newNoReply = newNode.getBoolAnnotation(kNoReplyAnnotation, false);
    if (oldNoReply && !newNoReply) {
        issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                    "Node " + name + " has been marked as returning a reply.");
    } else if (!oldNoReply && newNoReply) {
        issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                    "Node " + name + " has been marked as not returning a reply.");
    }

    std::string oldEcs = getEmitsChangedSignal(oldNode, oldInterface);
    std::string newEcs = getEmitsChangedSignal(newNode, newInterface);
    for (const auto& transition : kEmitsChangedSignalTransitions) {
        if (transition.oldValue == oldEcs && transition.newValue == newEcs) {
            issueOutput(transition.severity, "Node " + name + " " + transition.description + ".");
            break;
        }
    }
}

void InterfaceComparator::compareInterfaces(const Interface& oldInterface,
                                            const Interface& newInterface) {
    for (const auto& method : oldInterface.methods) {
        const Method* newMethod = newInterface.methods.get(method.name);
        if (newMethod == nullptr) {
            issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                        "Method " + quote(method.formatName()) + " has been removed.");
        } else {
            compareMembers("method", method, *newMethod);
        }
    }
    for (const auto& method : newInterface.methods) {
        if (!oldInterface.methods.has(method.name)) {
            issueOutput(Severity::FORWARDS_INCOMPATIBLE,
                        "Method " + quote(method.formatName()) + " has been added.");
        }
    }

    for (const auto& property : oldInterface.properties) {
        const Property* newProperty = newInterface.properties.get(property.name);
        if (newProperty == nullptr) {
            issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                        "Property " + quote(property.formatName()) + " has been removed.");
        } else {
            compareProperties(property, *newProperty, oldInterface, newInterface);
        }
    }
    for (const auto& property : newInterface.properties) {
        if (!oldInterface.properties.has(property.name)) {
            issueOutput(Severity::FORWARDS_INCOMPATIBLE,
                        "Property " + quote(property.formatName()) + " has been added.");
        }
    }

    for (const auto& signal : oldInterface.signals) {
        const Signal* newSignal = newInterface.signals.get(signal.name);
        if (newSignal == nullptr) {
            issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                        "Signal " + quote(signal.formatName()) + " has been removed.");
        } else {
            compareMembers("signal", signal, *newSignal);
        }
    }
    for (const auto& signal : newInterface.signals) {
        if (!oldInterface.signals.has(signal.name)) {
            issueOutput(Severity::FORWARDS_INCOMPATIBLE,
                        "Signal " + quote(signal.formatName()) + " has been added.");
        }
    }

    compareAnnotations(oldInterface, newInterface);
}

// Arguments are matched by position. Adding or removing one breaks every
// existing caller, in either direction.
void InterfaceComparator::compareMembers(const std::string& kind, const Member& oldMember,
                                         const Member& newMember) {
    size_t numOld = oldMember.arguments.size();
    size_t numNew = newMember.arguments.size();
    for (size_t i = 0; i < std::max(numOld, numNew); ++i) {
        if (i >= numOld) {
            issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                        "Argument " + newMember.arguments[i].formatName() + " of " + kind + " " +
                            quote(newMember.formatName()) + " has been added.");
        } else if (i >= numNew) {
            issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                        "Argument " + oldMember.arguments[i].formatName() + " of " + kind + " " +
                            quote(oldMember.formatName()) + " has been removed.");
        } else {
            compareArguments(oldMember.arguments[i], newMember.arguments[i]);
        }
    }

    compareAnnotations(oldMember, newMember);
}

void InterfaceComparator::compareProperties(const Property& oldProperty,
                                            const Property& newProperty,
                                            const Interface& oldInterface,
                                            const Interface& newInterface) {
    const std::string name = quote(oldProperty.formatName());

    if (oldProperty.type != newProperty.type) {
        issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                    "Property " + name + " has changed type from " + quote(oldProperty.type) +
                        " to " + quote(newProperty.type) + ".");
    }

    if ((oldProperty.access == Access::READ || oldProperty.access == Access::WRITE) &&
        newProperty.access == Access::READWRITE) {
        issueOutput(Severity::FORWARDS_INCOMPATIBLE,
                    "Property " + name + " has changed access from " +
                        quote(to_string(oldProperty.access)) + " to " +
                        quote(to_string(newProperty.access)) + ", becoming less restrictive.");
    } else if (oldProperty.access != newProperty.access) {
        issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                    "Property " + name + " has changed access from " +
                        quote(to_string(oldProperty.access)) + " to " +
                        quote(to_string(newProperty.access)) + ".");
    }

    compareAnnotations(oldProperty, newProperty, &oldInterface, &newInterface);
}

void InterfaceComparator::compareArguments(const Argument& oldArgument,
                                           const Argument& newArgument) {
    const std::string prefix =
        "Argument " + std::to_string(oldArgument.index) + " of " + quote(oldArgument.parent);

    if (oldArgument.name != newArgument.name) {
        issueOutput(Severity::INFO, prefix + " has changed name from " +
                                        quote(oldArgument.name) + " to " +
                                        quote(newArgument.name) + ".");
    }

    if (oldArgument.type != newArgument.type) {
        issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                    prefix + " has changed type from " + quote(oldArgument.type) + " to " +
                        quote(newArgument.type) + ".");
    }

    if (oldArgument.direction != newArgument.direction) {
        issueOutput(Severity::BACKWARDS_INCOMPATIBLE,
                    prefix + " has changed direction from " +
                        quote(to_string(oldArgument.direction)) + " to " +
                        quote(to_string(newArgument.direction)) + ".");
    }

    compareAnnotations(oldArgument, newArgument);
}

}  // namespace deviation
}  // namespace dbus
