#include <dnas/graph/allow_list.hpp>

namespace dnas::graph {

AllowList AllowList::defaults() {
    AllowList list;
    using K = OperationKind;
    using C = NodeCategory;

    // Layers whose output features are part of their configuration
    for (const char* type : {"Conv1d", "Conv2d", "Linear"}) {
        list.add(K::CALL_MODULE, type, C::FEATURES_DEFINING);
    }
    for (const char* fn : {"F.conv1d", "F.conv2d", "F.linear"}) {
        list.add(K::CALL_FUNCTION, fn, C::FEATURES_DEFINING);
        list.mark_untouchable(K::CALL_FUNCTION, fn);
    }

    // Channel-preserving layers
    for (const char* type : {"BatchNorm1d", "BatchNorm2d",
                             "AvgPool1d", "AvgPool2d", "MaxPool1d", "MaxPool2d",
                             "AdaptiveAvgPool1d", "AdaptiveAvgPool2d",
                             "Dropout", "Identity", "ReLU", "ReLU6",
                             "ConstantPad1d", "ConstantPad2d"}) {
        list.add(K::CALL_MODULE, type, C::FEATURES_PROPAGATING);
    }
    for (const char* fn : {"F.relu", "F.relu6", "F.log_softmax", "torch.relu"}) {
        list.add(K::CALL_FUNCTION, fn, C::FEATURES_PROPAGATING);
    }
    list.add(K::CALL_METHOD, "relu", C::FEATURES_PROPAGATING);

    // Element-wise combiners
    for (const char* fn : {"torch.add", "operator.add", "torch.sub", "operator.sub"}) {
        list.add(K::CALL_FUNCTION, fn, C::SHARED_INPUT_FEATURES);
    }
    list.add(K::CALL_METHOD, "add", C::SHARED_INPUT_FEATURES);
    list.add(K::CALL_METHOD, "sub", C::SHARED_INPUT_FEATURES);

    // Reshapes and concatenation
    list.add(K::CALL_FUNCTION, "torch.flatten", C::FLATTEN);
    list.add(K::CALL_METHOD, "flatten", C::FLATTEN);
    list.add(K::CALL_FUNCTION, "torch.squeeze", C::SQUEEZE);
    list.add(K::CALL_METHOD, "squeeze", C::SQUEEZE);
    list.add(K::CALL_FUNCTION, "torch.cat", C::FEATURES_CONCATENATE);

    return list;
}

std::optional<NodeCategory> AllowList::lookup(const Node& n, const ModuleRegistry& modules) const {
    for (const auto& rule : rules_) {
        if (auto category = rule(n, modules)) {
            return category;
        }
    }
    if (n.kind == OperationKind::CALL_MODULE) {
        std::string type = modules.type_of(n.target);
        if (type.empty()) return std::nullopt;
        return lookup(n.kind, type);
    }
    return lookup(n.kind, n.target);
}

} // namespace dnas::graph
