// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optics_generator.h
/// @brief Generation plans for shapes and spec declarations.
///
/// | Input        | Class            | Members                                      |
/// |--------------|------------------|----------------------------------------------|
/// | Product      | <Type>Lenses     | lens, with-updater per field; traversal and  |
/// |              |                  | fold per container field                     |
/// | CopyMutable  | <Type>Lenses     | same, setters via the paired withers         |
/// | Sum          | <Type>Prisms     | one prism per permitted variant              |
/// | Enumerated   | <Type>Prisms     | one prism per constant                       |
/// | Unsupported  | -                | GenerationError                              |
/// | OpticsSpec   | <Spec> / <X>Impl | one member per declared optic                |

#pragma once

#include <opticsgen/generated.h>
#include <opticsgen/options.h>
#include <opticsgen/prism_hint.h>
#include <opticsgen/spec_analyser.h>
#include <opticsgen/type_shape.h>

namespace opticsgen {

/// Lens on one field of a Product (positional constructor over all
/// components) or CopyMutable (paired wither) shape.
[[nodiscard]] OPTICSGEN_API Expr field_lens(const TypeShape& shape, const FieldDescriptor& field);

class OPTICSGEN_API OpticsGenerator {
public:
    explicit OpticsGenerator(const TypeIntrospector& types);

    /// @throws GenerationError for Unsupported shapes, for mutable types
    ///         without allow_mutable_fields, and for member name clashes
    [[nodiscard]] GeneratedClass generate(const TypeShape& shape, const GeneratorOptions& options) const;

    [[nodiscard]] GeneratedClass generate_spec(const SpecAnalysis& spec, const GeneratorOptions& options) const;

private:
    [[nodiscard]] GeneratedClass generate_lenses(const TypeShape& shape, const GeneratorOptions& options) const;
    [[nodiscard]] GeneratedClass generate_prisms(const TypeShape& shape, const GeneratorOptions& options) const;

    PrismHintResolver prisms_;
};

} // namespace opticsgen
