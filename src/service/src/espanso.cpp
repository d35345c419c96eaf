/**
 * @file espanso.cpp
 * @brief Точка входа исполняемого файла espanso
 */

#include "../include/service_controller.hpp"

int main(int argc, char** argv) {
  ServiceController controller;
  return controller.run(argc, argv);
}
