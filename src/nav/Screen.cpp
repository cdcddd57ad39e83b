#include "nav/Screen.hpp"

void Screen::init(Engine&) {}

void Screen::onExit(Engine&) {}

void Screen::onResume(Engine&) {}
