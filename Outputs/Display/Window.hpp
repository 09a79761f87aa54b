//
//  Window.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include <vector>

namespace Outputs::Display {

namespace Key {
constexpr int Escape = 27;
}

/*!
	A discrete input or windowing event, as drained from a @c Window once per frame.
*/
struct Event {
	enum class Type {
		Quit,
		KeyDown,
		WindowResized,
		Other,
	};
	Type type = Type::Other;

	/// Valid for @c KeyDown only.
	int keycode = 0;

	/// Valid for @c WindowResized only; in pixels.
	int width = 0, height = 0;

	static Event quit() {
		return Event{Type::Quit};
	}

	static Event key_down(const int keycode) {
		return Event{Type::KeyDown, keycode};
	}

	static Event resized(const int width, const int height) {
		return Event{Type::WindowResized, 0, width, height};
	}
};

/*!
	Provides a window with a current graphics context.
*/
class Window {
public:
	virtual ~Window() = default;

	/// @returns All events that have arrived since the previous call, in order of arrival.
	virtual std::vector<Event> poll_events() = 0;

	/// Presents the frame most recently drawn.
	virtual void present() = 0;
};

}
