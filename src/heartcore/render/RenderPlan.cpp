#include <heartcore/render/RenderPlan.hpp>

#include <typeinfo>

namespace HC {

auto RenderPlanSignature::from(RendererList const& renderers, RenderPlanSignatureStrategy strategy) -> RenderPlanSignature {
    RenderPlanSignature signature;
    signature.strategy = strategy;
    for (auto const& renderer : renderers) {
        if (strategy == RenderPlanSignatureStrategy::Identity) {
            signature.instances.push_back(reinterpret_cast<std::uintptr_t>(renderer.get()));
        } else if (renderer) {
            auto const& concrete = *renderer;
            signature.types.emplace_back(typeid(concrete));
        } else {
            signature.types.emplace_back(typeid(std::nullptr_t));
        }
    }
    return signature;
}

} // namespace HC
