#include "converter.hpp"
#include "course_fixture.hpp"
#include "serializer.hpp"
#include "validator.hpp"
#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

std::vector<fixture::Course> make_courses(int count) {
    std::vector<fixture::Course> courses;
    courses.reserve(count);
    for (int i = 0; i < count; ++i) {
        fixture::Course course = fixture::make_course();
        course.name = "course" + std::to_string(i);
        courses.push_back(course);
    }
    return courses;
}

jsonmodel::Document make_wide_object(int count) {
    std::map<std::string, int> values;
    for (int i = 0; i < count; ++i) {
        values["key" + std::to_string(i)] = i;
    }
    return jsonmodel::convert(values);
}

} // namespace

void benchmark_convert() {
    std::vector<fixture::Course> courses = make_courses(10000);
    auto start = std::chrono::high_resolution_clock::now();
    jsonmodel::Document doc = jsonmodel::convert(courses);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_convert: " << diff.count() << " s ("
              << doc.as<jsonmodel::Array>().size() << " courses)" << std::endl;
}

void benchmark_validate() {
    jsonmodel::Document doc = jsonmodel::convert(make_courses(10000));
    auto start = std::chrono::high_resolution_clock::now();
    bool is_valid = jsonmodel::validate(doc);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_validate: " << diff.count() << " s (valid: " << std::boolalpha
              << is_valid << ")" << std::endl;
}

void benchmark_stringify_nested() {
    jsonmodel::Document doc = jsonmodel::convert(make_courses(10000));
    auto start = std::chrono::high_resolution_clock::now();
    std::string json_str = jsonmodel::stringify(doc);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_stringify_nested: " << diff.count() << " s ("
              << json_str.size() << " bytes)" << std::endl;
}

void benchmark_stringify_wide() {
    jsonmodel::Document doc = make_wide_object(10000);
    auto start = std::chrono::high_resolution_clock::now();
    std::string json_str = jsonmodel::stringify(doc);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_stringify_wide: " << diff.count() << " s ("
              << json_str.size() << " bytes)" << std::endl;
}

int main() {
    try {
        benchmark_convert();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_convert failed: " << e.what() << std::endl;
    }
    try {
        benchmark_validate();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_validate failed: " << e.what() << std::endl;
    }
    try {
        benchmark_stringify_nested();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_stringify_nested failed: " << e.what() << std::endl;
    }
    try {
        benchmark_stringify_wide();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_stringify_wide failed: " << e.what() << std::endl;
    }
    return 0;
}
