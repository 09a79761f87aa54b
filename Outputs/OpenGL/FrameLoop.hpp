//
//  FrameLoop.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include "Outputs/Display/Window.hpp"

#include <cstddef>
#include <optional>

namespace Outputs::Display::OpenGL {

/*!
	Whatever is drawn once per frame.
*/
class Scene {
public:
	virtual ~Scene() = default;

	/// Announces the new size, in pixels, of the surface being drawn to.
	virtual void set_viewport(int width, int height) = 0;

	virtual void draw() = 0;
};

/*!
	Repeatedly drains @c window's events, then draws @c scene and presents it,
	until asked to quit.
*/
class FrameLoop {
public:
	FrameLoop(Display::Window &window, Scene &scene) : window_(window), scene_(scene) {}

	/*!
		Runs until a quit event or an escape key press arrives, or until @c max_frames have been drawn.
		A quit takes effect before the frame in which it is received is drawn.

		@returns The number of frames drawn.
	*/
	size_t run(std::optional<size_t> max_frames = std::nullopt);

	/*!
		Processes one iteration.

		@returns @c true if a frame was drawn; @c false if the loop has been asked to stop.
	*/
	bool step();

private:
	Display::Window &window_;
	Scene &scene_;
};

}
