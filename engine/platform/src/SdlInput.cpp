#include "blast/platform/SdlInput.hpp"

#include <SDL2/SDL.h>

namespace blast::platform {

namespace {

MouseButton ToMouseButton(Uint8 sdl_button) {
    switch (sdl_button) {
        case SDL_BUTTON_LEFT:
            return MouseButton::Left;
        case SDL_BUTTON_RIGHT:
            return MouseButton::Right;
        case SDL_BUTTON_MIDDLE:
            return MouseButton::Middle;
        default:
            return MouseButton::Unknown;
    }
}

KeyCode ToKey(SDL_Keycode sdl_keycode) {
    switch (sdl_keycode) {
        case SDLK_ESCAPE:
            return KeyCode::Escape;
        case SDLK_s:
            return KeyCode::S;
        case SDLK_r:
            return KeyCode::R;
        default:
            return KeyCode::Unknown;
    }
}

}  // namespace

std::vector<InputEvent> SdlInput::Poll() {
    std::vector<InputEvent> events;
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
        InputEvent evt;
        switch (sdl_event.type) {
            case SDL_QUIT:
                evt.type = InputEventType::Quit;
                events.push_back(evt);
                break;
            case SDL_MOUSEMOTION:
                evt.type = InputEventType::MouseMove;
                evt.x = sdl_event.motion.x;
                evt.y = sdl_event.motion.y;
                events.push_back(evt);
                break;
            case SDL_MOUSEBUTTONDOWN:
                evt.type = InputEventType::MouseButtonDown;
                evt.x = sdl_event.button.x;
                evt.y = sdl_event.button.y;
                evt.mouse_button = ToMouseButton(sdl_event.button.button);
                events.push_back(evt);
                break;
            case SDL_KEYDOWN:
                if (sdl_event.key.repeat != 0) {
                    break;
                }
                evt.type = InputEventType::KeyDown;
                evt.key = ToKey(sdl_event.key.keysym.sym);
                events.push_back(evt);
                break;
            case SDL_WINDOWEVENT:
                if (sdl_event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                    evt.type = InputEventType::WindowResized;
                    evt.x = sdl_event.window.data1;
                    evt.y = sdl_event.window.data2;
                    events.push_back(evt);
                }
                break;
            default:
                break;
        }
    }
    return events;
}

}  // namespace blast::platform
