// Ant Colony Simulation with OpenMP + SDL2 Visualization
// Draws ColonySimulation snapshots; all state changes go through the core

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "color.hpp"
#include "colony.hpp"

// ============================================================================
// Visualization constants
// ============================================================================

constexpr int PIXELS_PER_UNIT = 2;
constexpr int WINDOW_WIDTH = static_cast<int>(PLANE_WIDTH) * PIXELS_PER_UNIT;
constexpr int WINDOW_HEIGHT = static_cast<int>(PLANE_HEIGHT) * PIXELS_PER_UNIT;
constexpr int CLICK_FOOD_AMOUNT = 25;     // Units per click
constexpr double REMOVE_PICK_RADIUS = 10.0;  // Plane units around a right click
constexpr double DT_SCALE = 1.1;
constexpr int MAX_STEPS_PER_FRAME = 64;
constexpr int TARGET_FPS = 60;
constexpr int HUD_FONT_SIZE = 14;
constexpr int HUD_LINE_HEIGHT = 20;

const char* const FONT_CANDIDATES[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
};

const char* const CONTROLS[][2] = {
    {"LEFT CLICK", "Place food"},
    {"RIGHT CLICK", "Remove nearby food"},
    {"SPACE", "Pause/Resume"},
    {"R", "Reset simulation"},
    {"UP/DOWN", "Scale time step"},
    {"LEFT/RIGHT", "Steps per frame"},
    {"Q/ESC", "Quit"},
};

// ============================================================================
// View Class - SDL2 Visualization
// ============================================================================

class View {
   public:
    explicit View(const SimConfig& config) : sim(config) {}

    ~View() {
        shutdown();
    }

    bool init() {
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            std::cerr << "SDL init failed: " << SDL_GetError() << std::endl;
            return false;
        }
        sdl_started = true;

        if (TTF_Init() < 0) {
            std::cerr << "TTF init failed: " << TTF_GetError() << std::endl;
            return false;
        }
        ttf_started = true;

        window = SDL_CreateWindow("Ant Colony Simulation", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                  WINDOW_WIDTH, WINDOW_HEIGHT, SDL_WINDOW_SHOWN);
        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        // Fall back to the software renderer on machines without acceleration
        for (Uint32 flags : {static_cast<Uint32>(SDL_RENDERER_ACCELERATED), static_cast<Uint32>(SDL_RENDERER_SOFTWARE)}) {
            renderer = SDL_CreateRenderer(window, -1, flags);
            if (renderer)
                break;
        }
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        font = openFont();
        if (!font) {
            std::cerr << "Warning: no usable font found, HUD disabled" << std::endl;
        }
        return true;
    }

    void run() {
        printBanner();

        const Uint32 frame_budget_ms = 1000 / TARGET_FPS;
        bool reported = false;

        while (running) {
            const Uint32 frame_start = SDL_GetTicks();

            pollInput();
            if (!paused) {
                advanceFrame();
            }

            const bool complete = sim.is_complete();
            if (complete && !reported) {
                const SimStats& stats = sim.stats();
                std::cout << "All food delivered: " << stats.food_delivered << " units in " << stats.sim_time
                          << " time units (" << stats.steps << " steps)" << std::endl;
            }
            reported = complete;

            draw(sim.snapshot());

            const Uint32 elapsed = SDL_GetTicks() - frame_start;
            if (elapsed < frame_budget_ms) {
                SDL_Delay(frame_budget_ms - elapsed);
            }
        }
    }

   private:
    ColonySimulation sim;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    TTF_Font* font = nullptr;
    bool sdl_started = false;
    bool ttf_started = false;

    bool running = true;
    bool paused = false;
    int steps_per_frame = 1;
    double step_wall_ms = 0.0;  // Wall time spent inside step(), for the HUD

    static TTF_Font* openFont() {
        for (const char* path : FONT_CANDIDATES) {
            if (TTF_Font* f = TTF_OpenFont(path, HUD_FONT_SIZE))
                return f;
        }
        return nullptr;
    }

    void shutdown() {
        if (font) {
            TTF_CloseFont(font);
            font = nullptr;
        }
        if (renderer) {
            SDL_DestroyRenderer(renderer);
            renderer = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        if (ttf_started) {
            TTF_Quit();
            ttf_started = false;
        }
        if (sdl_started) {
            SDL_Quit();
            sdl_started = false;
        }
    }

    void printBanner() const {
        const SimConfig& config = sim.config();
        std::cout << "=== Ant Colony Simulation (Visualization) ===" << std::endl;
        std::cout << "Plane: " << config.width << "x" << config.height << ", ants: " << config.population
                  << ", seed: " << config.seed << ", OpenMP threads: " << sim.num_threads() << std::endl;
        std::cout << "Controls:" << std::endl;
        for (const auto& control : CONTROLS) {
            std::cout << "  " << std::left << std::setw(12) << control[0] << " - " << control[1] << std::endl;
        }
    }

    static Vec2 toPlane(int px, int py) {
        return Vec2(static_cast<double>(px) / PIXELS_PER_UNIT, static_cast<double>(py) / PIXELS_PER_UNIT);
    }

    static int toScreen(double v) {
        return static_cast<int>(v * PIXELS_PER_UNIT);
    }

    void pollInput() {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
                case SDL_QUIT:
                    running = false;
                    break;
                case SDL_MOUSEBUTTONDOWN:
                    onClick(event.button);
                    break;
                case SDL_KEYDOWN:
                    onKey(event.key.keysym.sym);
                    break;
                default:
                    break;
            }
        }
    }

    void onClick(const SDL_MouseButtonEvent& button) {
        const Vec2 at = toPlane(button.x, button.y);
        if (button.button == SDL_BUTTON_LEFT) {
            PlaceFoodResult placed = sim.place_food(at, CLICK_FOOD_AMOUNT);
            if (!placed.ok()) {
                std::cerr << "Food not placed: " << place_status_name(placed.status) << std::endl;
            }
        } else if (button.button == SDL_BUTTON_RIGHT) {
            int nearest = -1;
            double best = REMOVE_PICK_RADIUS * REMOVE_PICK_RADIUS;
            const ColonySnapshot snap = sim.snapshot();
            for (const FoodView& food : snap.food) {
                double d2 = distance_squared(food.position, at);
                if (d2 <= best) {
                    best = d2;
                    nearest = food.id;
                }
            }
            if (nearest != -1) {
                sim.remove_food(nearest);
            }
        }
    }

    void onKey(SDL_Keycode key) {
        switch (key) {
            case SDLK_ESCAPE:
            case SDLK_q:
                running = false;
                break;
            case SDLK_SPACE:
                paused = !paused;
                break;
            case SDLK_r:
                sim.reset();
                step_wall_ms = 0.0;
                break;
            case SDLK_UP:
                sim.set_time_step(sim.time_step() * DT_SCALE);
                break;
            case SDLK_DOWN:
                sim.set_time_step(sim.time_step() / DT_SCALE);
                break;
            case SDLK_RIGHT:
                steps_per_frame = std::min(steps_per_frame * 2, MAX_STEPS_PER_FRAME);
                break;
            case SDLK_LEFT:
                steps_per_frame = std::max(steps_per_frame / 2, 1);
                break;
            default:
                break;
        }
    }

    void advanceFrame() {
        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < steps_per_frame; ++i) {
            sim.step();
        }
        auto end = std::chrono::high_resolution_clock::now();
        step_wall_ms += std::chrono::duration<double, std::milli>(end - start).count();
    }

    void fillRect(double x, double y, int w, int h, const rgb& c) {
        SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
        SDL_Rect rect = {toScreen(x) - w / 2, toScreen(y) - h / 2, w, h};
        SDL_RenderFillRect(renderer, &rect);
    }

    void draw(const ColonySnapshot& snap) {
        SDL_SetRenderDrawColor(renderer, DIRT_COLOR.r, DIRT_COLOR.g, DIRT_COLOR.b, DIRT_COLOR.a);
        SDL_RenderClear(renderer);

        drawField(snap.field);

        const int nest_px = static_cast<int>(snap.home_radius * PIXELS_PER_UNIT) / 2;
        fillRect(snap.home.x, snap.home.y, nest_px, nest_px, NEST_COLOR);

        // Patch side shrinks with the square root of what is left
        for (const FoodView& food : snap.food) {
            double fraction = static_cast<double>(food.quantity) / std::max(1, food.initial_quantity);
            int side = std::max(2, static_cast<int>(10 * PIXELS_PER_UNIT * std::sqrt(fraction)));
            fillRect(food.position.x, food.position.y, side, side, FOOD_COLOR);
        }

        // Long side along the dominant heading axis
        for (const AntView& ant : snap.ants) {
            bool horizontal = std::abs(std::cos(ant.heading)) > std::abs(std::sin(ant.heading));
            int w = (horizontal ? 3 : 2) * PIXELS_PER_UNIT;
            int h = (horizontal ? 2 : 3) * PIXELS_PER_UNIT;
            fillRect(ant.position.x, ant.position.y, w, h,
                     ant.carrying_food ? RETURNING_ANT_COLOR : SEARCHING_ANT_COLOR);
        }

        drawHud(snap);
        SDL_RenderPresent(renderer);
    }

    void drawField(const FieldView& field) {
        const int cell_px = static_cast<int>(std::ceil(field.cell_size * PIXELS_PER_UNIT));
        const double max_intensity = sim.config().max_intensity;
        for (int row = 0; row < field.rows; row++) {
            for (int col = 0; col < field.cols; col++) {
                double home = field.at(col, row, PheromoneChannel::TO_HOME);
                double trail = field.at(col, row, PheromoneChannel::FOOD_TRAIL);
                if (home <= 0.0 && trail <= 0.0)
                    continue;

                rgb c = field_color(home, trail, max_intensity);
                SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
                SDL_Rect rect = {toScreen(col * field.cell_size), toScreen(row * field.cell_size), cell_px, cell_px};
                SDL_RenderFillRect(renderer, &rect);
            }
        }
    }

    void drawHud(const ColonySnapshot& snap) {
        if (!font)
            return;

        const SDL_Color normal = {255, 255, 255, 255};
        const SDL_Color highlight = {255, 255, 0, 255};
        const bool complete = sim.is_complete();
        const SimStats& stats = snap.stats;

        std::vector<std::pair<std::string, SDL_Color>> lines;

        std::ostringstream status;
        status << std::fixed << std::setprecision(2) << "Step: " << stats.steps << " | Food Delivered: "
               << stats.food_delivered << "/" << stats.food_placed << " | Time Elapsed: " << stats.sim_time
               << " | dt: " << std::setprecision(3) << snap.dt << " | Speed: " << steps_per_frame << "x | "
               << (paused ? "PAUSED" : "RUNNING");
        lines.emplace_back(status.str(), complete ? highlight : normal);

        lines.emplace_back("CLICK=Food, RCLICK=Remove, SPACE=Pause, R=Reset, UP/DOWN=dt, LEFT/RIGHT=Speed, Q=Quit",
                           normal);

        if (stats.steps > 0) {
            std::ostringstream perf;
            perf << std::fixed << std::setprecision(3) << "Avg step: " << step_wall_ms / stats.steps
                 << " ms | Threads: " << sim.num_threads();
            lines.emplace_back(perf.str(), normal);
        }

        if (complete) {
            std::ostringstream done;
            done << std::fixed << std::setprecision(2) << "ALL FOOD DELIVERED! Total time: " << stats.sim_time;
            lines.emplace_back(done.str(), highlight);
        }

        int y = 10;
        for (const auto& line : lines) {
            drawText(line.first, 10, y, line.second);
            y += HUD_LINE_HEIGHT;
        }
    }

    void drawText(const std::string& text, int x, int y, SDL_Color color) {
        SDL_Surface* surface = TTF_RenderText_Blended(font, text.c_str(), color);
        if (!surface)
            return;
        SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
        if (texture) {
            SDL_Rect dst = {x, y, surface->w, surface->h};
            SDL_RenderCopy(renderer, texture, nullptr, &dst);
            SDL_DestroyTexture(texture);
        }
        SDL_FreeSurface(surface);
    }
};

int main(int argc, char* argv[]) {
    SimConfig config;
    if (argc > 1) {
        config.num_threads = std::atoi(argv[1]);
    }
    if (argc > 2) {
        config.seed = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10));
    }

    try {
        View view(config);
        if (!view.init()) {
            std::cerr << "Failed to initialize view" << std::endl;
            return 1;
        }
        view.run();
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
