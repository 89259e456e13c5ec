#ifndef JSONMODEL_UTILS_OVERLOADED_HPP
#define JSONMODEL_UTILS_OVERLOADED_HPP

namespace jsonmodel::utils {

    // Builds a std::visit visitor out of lambdas, one per alternative.
    template <typename... Fns> struct overloaded : Fns... {
        using Fns::operator()...;
    };

    template <typename... Fns> overloaded(Fns...) -> overloaded<Fns...>;

} // namespace jsonmodel::utils

#endif // JSONMODEL_UTILS_OVERLOADED_HPP
