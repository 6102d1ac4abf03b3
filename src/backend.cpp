#include "backend.hpp"

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

const BackendDescriptor& Backend::descriptor() const {
  return std::visit([](const auto& b) -> const BackendDescriptor& { return b.descriptor(); },
                    *impl_);
}

std::string Backend::model_path() const {
  return std::visit(overloaded{[](const LocalBackend& b) { return b.model_path(); },
                               [](const auto&) { return std::string(); }},
                    *impl_);
}

BackendReply Backend::analyze(const BackendInput& input, const CancelToken& token) const {
  return std::visit([&](const auto& b) { return b.analyze(input, token); }, *impl_);
}
