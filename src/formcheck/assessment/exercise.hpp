#pragma once

#include <variant>

#include "lunge.hpp"
#include "pushup.hpp"
#include "squat.hpp"

namespace formcheck
{
// ---------------------------------------------------------------- ExerciseKind
//
enum class ExerciseKind : int8_t { SQUAT = 0, PUSHUP, LUNGE };

const char* str(const ExerciseKind) noexcept;

// Trims and lower-cases `id`. "push-up" and "push_up" are "pushup". nullopt
// if the exercise is not supported.
std::optional<ExerciseKind> parse_exercise(const string_view id) noexcept;

// "'squat', 'pushup' or 'lunge'"
string supported_exercises_str() noexcept;

// --------------------------------------------------------------- ExerciseModel
// Each alternative carries its extractor, aggregation policy, score tables
// and feedback text. Operate on it with `std::visit`.
using ExerciseModel = std::variant<SquatModel, PushupModel, LungeModel>;

ExerciseModel make_exercise_model(const ExerciseKind kind) noexcept;

ExerciseKind kind_of(const ExerciseModel& model) noexcept;

const ExerciseDefinition& definition_of(const ExerciseKind kind) noexcept;

} // namespace formcheck
