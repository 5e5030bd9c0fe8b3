#include "exercise.hpp"

namespace formcheck
{
const char* str(const ExerciseKind x) noexcept
{
   switch(x) {
   case ExerciseKind::SQUAT: return SquatModel::k_name;
   case ExerciseKind::PUSHUP: return PushupModel::k_name;
   case ExerciseKind::LUNGE: return LungeModel::k_name;
   }
   return "<unknown>";
}

std::optional<ExerciseKind> parse_exercise(const string_view id) noexcept
{
   const auto val = string_to_lowercase(trim_copy(id));
   if(val == "squat") return ExerciseKind::SQUAT;
   if(val == "pushup" or val == "push-up" or val == "push_up")
      return ExerciseKind::PUSHUP;
   if(val == "lunge") return ExerciseKind::LUNGE;
   return std::nullopt;
}

string supported_exercises_str() noexcept
{
   return format("'{}', '{}' or '{}'",
                 str(ExerciseKind::SQUAT),
                 str(ExerciseKind::PUSHUP),
                 str(ExerciseKind::LUNGE));
}

ExerciseModel make_exercise_model(const ExerciseKind kind) noexcept
{
   switch(kind) {
   case ExerciseKind::SQUAT: return SquatModel{};
   case ExerciseKind::PUSHUP: return PushupModel{};
   case ExerciseKind::LUNGE: return LungeModel{};
   }
   FATAL(format("unhandled exercise kind {}", int(kind)));
   return SquatModel{};
}

ExerciseKind kind_of(const ExerciseModel& model) noexcept
{
   return ExerciseKind(model.index());
}

const ExerciseDefinition& definition_of(const ExerciseKind kind) noexcept
{
   switch(kind) {
   case ExerciseKind::SQUAT: return SquatModel::definition();
   case ExerciseKind::PUSHUP: return PushupModel::definition();
   case ExerciseKind::LUNGE: return LungeModel::definition();
   }
   FATAL(format("unhandled exercise kind {}", int(kind)));
   return SquatModel::definition();
}

} // namespace formcheck
