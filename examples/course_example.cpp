#include "converter.hpp"
#include "observability.hpp"
#include "serializer.hpp"
#include "validator.hpp"
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

class ConsoleLogger : public jsonmodel::ILogger {
public:
    bool log(jsonmodel::LogLevel level,
             std::string_view message,
             std::string_view operation,
             std::chrono::microseconds duration,
             std::string_view key) override {
        std::cout << "[LogLevel::" << static_cast<int>(level) << "] "
                  << message << " | "
                  << "operation: " << operation << " | "
                  << "duration: " << duration.count() << "us";
        if (!key.empty()) {
            std::cout << " | key: " << key;
        }
        std::cout << std::endl;
        return true;
    }
};

enum class EvalType { TEST, PROJECT, EXAM };

std::string_view enum_name(EvalType type) {
    switch (type) {
        case EvalType::TEST: return "TEST";
        case EvalType::PROJECT: return "PROJECT";
        case EvalType::EXAM: return "EXAM";
    }
    return "";
}

struct EvalItem {
    std::string name;
    double percentage;
    bool mandatory;
    std::optional<EvalType> type;

    static constexpr auto json_fields() {
        return std::make_tuple(jsonmodel::field("name", &EvalItem::name),
                               jsonmodel::field("percentage", &EvalItem::percentage),
                               jsonmodel::field("mandatory", &EvalItem::mandatory),
                               jsonmodel::field("type", &EvalItem::type));
    }
};

struct Course {
    std::string name;
    int credits;
    std::vector<EvalItem> evaluation;

    static constexpr auto json_fields() {
        return std::make_tuple(jsonmodel::field("name", &Course::name),
                               jsonmodel::field("credits", &Course::credits),
                               jsonmodel::field("evaluation", &Course::evaluation));
    }
};

int main() {
    ConsoleLogger logger;
    jsonmodel::set_logger(&logger);
    jsonmodel::set_log_level_threshold(jsonmodel::LogLevel::Debug);

    Course course{"PA", 6, {
        EvalItem{"quizzes", 0.2, false, std::nullopt},
        EvalItem{"project", 0.8, true, EvalType::PROJECT}
    }};

    jsonmodel::Document json = jsonmodel::convert(course);
    std::cout << "Is valid: " << std::boolalpha << jsonmodel::validate(json) << std::endl;
    std::cout << "Serialized: " << jsonmodel::stringify(json) << std::endl;

    jsonmodel::Array credits = jsonmodel::convert(std::vector<int>{6, 3, 7}).as<jsonmodel::Array>();
    jsonmodel::Array doubled = credits.map([](const jsonmodel::Document& value) -> jsonmodel::Document {
        return jsonmodel::Number(value.as<jsonmodel::Number>().as_int() * 2);
    });
    std::cout << "Doubled: " << jsonmodel::stringify(doubled) << std::endl;

    try {
        jsonmodel::convert(std::map<int, std::string>{{0, "zero"}});
    } catch (const jsonmodel::invalid_argument& e) {
        std::cout << "Rejected: " << e.what() << std::endl;
    }

    jsonmodel::set_logger(nullptr);
    return 0;
}
