#include <pbi_scan/cli/workspace_picker.hpp>

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <deque>
#include <string>

namespace pbi_scan {

std::vector<size_t> RunWorkspacePicker(const std::vector<WorkspaceRef>& candidates) {
    using namespace ftxui;

    // Checkbox keeps a pointer to its state; deque never relocates elements.
    std::deque<bool> checked(candidates.size(), false);

    auto screen = ScreenInteractive::FitComponent();

    auto list = Container::Vertical({});
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& ws = candidates[i];
        list->Add(Checkbox(ws.name + "  (" + ws.id + ")", &checked[i]));
    }

    auto scan_button = Button("  Scan  ", [&] { screen.Exit(); });
    auto all_button = Button(" Toggle all ", [&] {
        bool any_unchecked = false;
        for (bool c : checked) {
            any_unchecked = any_unchecked || !c;
        }
        for (auto& c : checked) {
            c = any_unchecked;
        }
    });

    auto form = Container::Vertical({
        list,
        Container::Horizontal({scan_button, all_button}),
    });

    form |= CatchEvent([&](Event event) {
        if (event == Event::Escape) {
            screen.Exit();
            return true;
        }
        return false;
    });

    auto renderer = Renderer(form, [&] {
        size_t count = 0;
        for (bool c : checked) {
            count += c ? 1 : 0;
        }
        const auto status = count == 0
            ? std::string("Nothing checked: all ") + std::to_string(candidates.size()) +
                  " workspaces will be scanned"
            : std::to_string(count) + " of " + std::to_string(candidates.size()) +
                  " workspaces checked";

        return vbox({
                   text("Select workspaces to scan") | bold | center,
                   separator(),
                   list->Render() | vscroll_indicator | frame |
                       size(HEIGHT, LESS_THAN, 20),
                   separator(),
                   text(status) | dim,
                   hbox({
                       scan_button->Render(),
                       text("  "),
                       all_button->Render(),
                   }) | center,
               }) |
               border | size(WIDTH, LESS_THAN, 100);
    });

    screen.Loop(renderer);

    std::vector<size_t> picked;
    for (size_t i = 0; i < checked.size(); ++i) {
        if (checked[i]) {
            picked.push_back(i);
        }
    }
    return picked;
}

} // namespace pbi_scan
