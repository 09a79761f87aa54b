//
//  main.cpp
//  Trichrome
//
//  Created by Thomas Harte on 04/11/2017.
//  Copyright 2017 Thomas Harte. All rights reserved.
//

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Outputs/OpenGL/OpenGL.hpp"

#include <SDL2/SDL.h>

#include "OSBindings/SDL/Arguments.hpp"
#include "Outputs/Display/Window.hpp"
#include "Outputs/ErrorChain.hpp"
#include "Outputs/Log.hpp"
#include "Outputs/OpenGL/API.hpp"
#include "Outputs/OpenGL/FrameLoop.hpp"
#include "Outputs/OpenGL/TriangleScene.hpp"
#include "Storage/Resources.hpp"

using namespace CommandLine;

namespace {

using Logger = Log::Logger<Log::Source::Window>;

std::runtime_error sdl_error(const std::string &action) {
	return std::runtime_error(action + " failed: " + SDL_GetError());
}

/*!
	Owns SDL's video subsystem for the lifetime of the process.
*/
struct SDLVideo {
	SDLVideo() {
		if(SDL_Init(SDL_INIT_VIDEO) < 0) {
			throw sdl_error("SDL_Init");
		}
	}

	~SDLVideo() {
		SDL_Quit();
	}
};

/*!
	An SDL window with a current OpenGL context.
*/
class SDLWindow: public Outputs::Display::Window {
public:
	SDLWindow(const std::string &title, const int width, const int height, const Outputs::Display::OpenGL::API api) {
		using namespace Outputs::Display::OpenGL;

		// Ask for no depth buffer, a core profile and vsync-aligned rendering.
		SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 0);
		SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
		SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, major_version(api));
		SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, minor_version(api));

		window_ = SDL_CreateWindow(
			title.c_str(),
			SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
			width, height,
			SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);
		if(!window_) {
			throw sdl_error("SDL_CreateWindow");
		}

		gl_context_ = SDL_GL_CreateContext(window_);
		if(!gl_context_) {
			SDL_DestroyWindow(window_);
			throw sdl_error("SDL_GL_CreateContext");
		}

		SDL_GL_MakeCurrent(window_, gl_context_);
		SDL_GL_SetSwapInterval(1);

		Logger::info().append(
			"Created %d x %d window with OpenGL %s",
			width, height, reinterpret_cast<const char *>(glGetString(GL_VERSION)));
	}

	~SDLWindow() {
		SDL_GL_DeleteContext(gl_context_);
		SDL_DestroyWindow(window_);
	}

	SDLWindow(const SDLWindow &) = delete;
	SDLWindow &operator =(const SDLWindow &) = delete;

	/// @returns The size of the window's drawable area, in pixels.
	std::pair<int, int> drawable_size() const {
		int width = 0, height = 0;
		SDL_GL_GetDrawableSize(window_, &width, &height);
		return std::make_pair(width, height);
	}

	std::vector<Outputs::Display::Event> poll_events() override {
		using Event = Outputs::Display::Event;
		std::vector<Event> events;

		SDL_Event event;
		while(SDL_PollEvent(&event)) {
			switch(event.type) {
				case SDL_QUIT:
					events.push_back(Event::quit());
				break;

				case SDL_KEYDOWN:
					events.push_back(Event::key_down(int(event.key.keysym.sym)));
				break;

				case SDL_WINDOWEVENT:
					switch(event.window.event) {
						case SDL_WINDOWEVENT_RESIZED: {
							const auto size = drawable_size();
							events.push_back(Event::resized(size.first, size.second));
						} break;

						default:
							events.emplace_back();
						break;
					}
				break;

				default:
					events.emplace_back();
				break;
			}
		}

		return events;
	}

	void present() override {
		SDL_GL_SwapWindow(window_);
	}

private:
	SDL_Window *window_ = nullptr;
	SDL_GLContext gl_context_ = nullptr;
};

}

int main(int argc, char *argv[]) {
	const ParsedArguments arguments = parse_arguments(argc, argv);
	const std::string usage_suffix =
		" [--assets={path}] [--shader={name}] [--width={pixels}] [--height={pixels}] [--api={core45|core32}] [--frames={count}]";

	// Print a help message if requested.
	if(arguments.selections.find("help") != arguments.selections.end() || arguments.selections.find("h") != arguments.selections.end()) {
		std::cout << "Usage: " << final_path_component(argv[0]) << usage_suffix << std::endl;
		std::cout << "Draws a single triangle using the shaders {name}.vert and {name}.frag, found beneath the assets path." << std::endl;
		std::cout << "Press escape or close the window to exit." << std::endl;
		return EXIT_SUCCESS;
	}

	Options options;
	if(const auto invalid = apply(arguments, options)) {
		std::cerr << "Invalid value for --" << *invalid << std::endl;
		std::cerr << "Usage: " << final_path_component(argv[0]) << usage_suffix << std::endl;
		return EXIT_FAILURE;
	}

	try {
		const auto resources =
			options.assets ?
				Storage::FileResources(*options.assets) :
				Storage::FileResources::relative_to_executable("assets");

		SDLVideo video;
		SDLWindow window(final_path_component(argv[0]), options.width, options.height, options.api);

		Outputs::Display::OpenGL::TriangleScene scene(resources, options.shader);
		const auto size = window.drawable_size();
		scene.set_viewport(size.first, size.second);

		Outputs::Display::OpenGL::FrameLoop loop(window, scene);
		const auto frames = loop.run(options.frames);
		Logger::info().append("Exited after %zu frames", frames);
	} catch(const std::exception &error) {
		Log::print_cause_chain(stderr, error);
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
