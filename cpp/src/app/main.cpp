// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Исключения, вылетевшие из app::run, перехватываются здесь и печатаются
// в формате "[x] <message>".
//
// ==============================================================================

#include "jsondiff/app.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        return jsondiff::app::run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
