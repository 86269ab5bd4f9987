// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file spec_analyser.h
/// @brief Reads optics declared explicitly for types the engine does not control.
///
/// A spec is an interface deriving from opticsgen::OpticsSpec<S>. Each
/// abstract, parameterless method returning one of
///
///     opticsgen::Lens<S, A>      copy strategy annotation required
///     opticsgen::Prism<S, A>     prism hint annotation required
///     opticsgen::Traversal<S, A> traversal hint annotation required
///     opticsgen::Fold<S, A>      traversal hint annotation required
///     opticsgen::Affine / Iso / Getter<S, A>
///
/// declares one optic named after the method. Default methods are kept and
/// emitted as placeholders.
///
/// @code
/// interface PersonOpticsSpec : OpticsSpec<Person> {
///     @ViaBuilder Lens<Person, std::string> name();
///     @ThroughField(field = "tags") Traversal<Person, std::string> eachTag();
/// };
/// @endcode

#pragma once

#include <opticsgen/container_classifier.h>
#include <opticsgen/generated.h>
#include <opticsgen/strategies.h>

#include <immer/vector.hpp>

#include <string>
#include <string_view>

namespace opticsgen {

inline constexpr std::string_view kOpticsSpecBase = "opticsgen::OpticsSpec";

/// Annotation names read from spec methods.
namespace annotations {
inline constexpr std::string_view kViaBuilder = "ViaBuilder";
inline constexpr std::string_view kWither = "Wither";
inline constexpr std::string_view kViaConstructor = "ViaConstructor";
inline constexpr std::string_view kViaCopyAndSet = "ViaCopyAndSet";
inline constexpr std::string_view kInstanceOf = "InstanceOf";
inline constexpr std::string_view kMatchWhen = "MatchWhen";
inline constexpr std::string_view kTraverseWith = "TraverseWith";
inline constexpr std::string_view kThroughField = "ThroughField";
} // namespace annotations

struct SpecOptic {
    std::string name;
    OpticKind kind = OpticKind::Lens;
    TypeRef focus;
    CopyStrategyInfo copy;
    PrismHintInfo prism;
    TraversalHintInfo traversal;
};

struct SpecDefaultMethod {
    std::string name;
    TypeRef return_type;
};

struct OPTICSGEN_API SpecAnalysis {
    std::string spec_name;
    std::string scope;
    TypeRef source;
    immer::vector<SpecOptic> optics;
    immer::vector<SpecDefaultMethod> default_methods;

    /// "PersonOpticsSpec" -> "PersonOptics", "PersonOptics" -> "PersonOpticsImpl"
    [[nodiscard]] std::string generated_name() const;

    [[nodiscard]] const SpecOptic* find(std::string_view optic) const noexcept;
};

class OPTICSGEN_API SpecAnalyser {
public:
    explicit SpecAnalyser(const TypeIntrospector& types, ContainerClassifier classifier = {});

    /// @throws GenerationError naming the offending method on the first invalid declaration
    [[nodiscard]] SpecAnalysis analyse(const TypeDecl& spec) const;

private:
    [[nodiscard]] SpecOptic analyse_method(const TypeDecl& spec, const TypeRef& source, const MethodDecl& method) const;
    [[nodiscard]] std::string detect_traversal(const TypeDecl& spec, const TypeRef& source,
                                               const MethodDecl& method, const std::string& field) const;

    const TypeIntrospector& types_;
    ContainerClassifier classifier_;
};

} // namespace opticsgen
