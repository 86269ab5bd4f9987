// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file engine.h
/// @brief One generation pass over a batch of requests.
///
/// Data flow per request:
///
///   TypeDecl --TypeShapeAnalyser--> TypeShape --OpticsGenerator--> <Type>Lenses / <Type>Prisms
///   TypeDecl --TypeShapeAnalyser--> TypeShape --NavigatorComposer--> <Type>Focus
///   TypeDecl --SpecAnalyser-------> SpecAnalysis --OpticsGenerator--> <Spec>
///
/// A GenerationError is reported once for its request and the pass moves on
/// to the next request. UnresolvedStrategyError is a defect and propagates.

#pragma once

#include <opticsgen/generated.h>
#include <opticsgen/navigator.h>
#include <opticsgen/optics_generator.h>
#include <opticsgen/spec_analyser.h>
#include <opticsgen/type_shape.h>

#include <immer/vector.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace opticsgen {

enum class RequestKind : std::uint8_t {
    Optics, ///< lenses or prisms, by shape
    Focus,  ///< focus class with navigators
    Spec,   ///< explicitly declared optics
};

struct GenerationRequest {
    std::string type_name;
    RequestKind kind = RequestKind::Optics;
    GeneratorOptions options;
};

struct Diagnostic {
    std::string type_name;
    std::string member;
    std::string message;
};

struct OPTICSGEN_API RunReport {
    immer::vector<std::string> generated;
    immer::vector<Diagnostic> diagnostics;

    [[nodiscard]] bool ok() const noexcept { return diagnostics.empty(); }
};

class OPTICSGEN_API Engine {
public:
    Engine(const TypeIntrospector& types, CodeSink& sink, ContainerClassifier classifier = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Builds the plan for one request without writing it.
    /// @throws GenerationError
    [[nodiscard]] GeneratedClass plan(const GenerationRequest& request) const;

    /// Plans and writes every request, each generated class name at most once.
    RunReport run(const std::vector<GenerationRequest>& requests);

    [[nodiscard]] const TypeShapeAnalyser& analyser() const noexcept { return analyser_; }

private:
    const TypeIntrospector& types_;
    CodeSink& sink_;
    TypeShapeAnalyser analyser_;
    SpecAnalyser specs_;
    OpticsGenerator generator_;
    NavigatorComposer navigators_;
};

} // namespace opticsgen
