//
//  FrameLoop.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include "FrameLoop.hpp"

#include "Outputs/Log.hpp"

using namespace Outputs::Display::OpenGL;

namespace {
using Logger = Log::Logger<Log::Source::FrameLoop>;
}

bool FrameLoop::step() {
	for(const auto &event: window_.poll_events()) {
		switch(event.type) {
			case Event::Type::Quit:
				Logger::info().append("Quit requested");
			return false;

			case Event::Type::KeyDown:
				if(event.keycode == Key::Escape) {
					Logger::info().append("Escape pressed");
					return false;
				}
			break;

			case Event::Type::WindowResized:
				Logger::info().append("Resized to %d x %d", event.width, event.height);
				scene_.set_viewport(event.width, event.height);
			break;

			default: break;
		}
	}

	scene_.draw();
	window_.present();
	return true;
}

size_t FrameLoop::run(const std::optional<size_t> max_frames) {
	size_t frames = 0;
	while(!max_frames || frames < *max_frames) {
		if(!step()) break;
		++frames;
	}
	return frames;
}
