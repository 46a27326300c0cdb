#include "KeyboardInput.h"

#include <SFML/Window/Keyboard.hpp>

void KeyboardInput::handleEvent(const sf::Event& event) {
    if (event.type == sf::Event::Closed) {
        quit_ = true;
        return;
    }

    if (event.type != sf::Event::KeyPressed) {
        return;
    }

    switch (event.key.code) {
        case sf::Keyboard::Escape:
            quit_ = true;
            break;
        case sf::Keyboard::Space:
            fire_ = true;
            break;
        case sf::Keyboard::R:
            restart_ = true;
            break;
        default:
            break;
    }
}

InputState KeyboardInput::collect(bool hasFocus) {
    InputState input;

    if (hasFocus) {
        movementFromKeys(sf::Keyboard::isKeyPressed(sf::Keyboard::Up),
                         sf::Keyboard::isKeyPressed(sf::Keyboard::Down),
                         sf::Keyboard::isKeyPressed(sf::Keyboard::Left),
                         sf::Keyboard::isKeyPressed(sf::Keyboard::Right),
                         input.dx, input.dy);
    }

    input.fire = fire_;
    input.restart = restart_;
    input.quit = quit_;

    fire_ = false;
    restart_ = false;
    quit_ = false;
    return input;
}
