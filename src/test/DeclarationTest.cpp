#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/FileBinding.hpp"
#include "infrastructure/codecs/Codecs.hpp"
#include "test/TestEnvironment.hpp"

using stowage::test::ScratchHome;
namespace fs = std::filesystem;

namespace game {

struct Settings {
    int volume = 50;
    std::string language = "en";
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Settings, volume, language)

struct SaveSlot {
    std::vector<int> inventory;
    std::string zone;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SaveSlot, inventory, zone)

} // namespace game

namespace stowage::application {

template <>
struct FileBinding<game::Settings> {
    using Codec = infrastructure::codecs::TomlCodec;
    static domain::Binding binding() {
        return {domain::DirectoryKind::Config, "Game", "", "settings"};
    }
};

template <>
struct FileBinding<game::SaveSlot> {
    using Codec = infrastructure::codecs::CborCodec;
    static domain::Binding binding() {
        domain::Binding b(domain::DirectoryKind::Data, "Game", "saves/slot1", "slot");
        b.compressed = true;
        return b;
    }
};

} // namespace stowage::application

int main() {
    std::cout << "[Test] Starting Declaration Test..." << std::endl;
    ScratchHome home("declaration");

    std::cout << "[Test] Declared types save and load without arguments..." << std::endl;
    game::Settings settings;
    settings.volume = 80;
    settings.language = "pt-BR";
    stowage::domain::Metadata saved = stowage::application::save(settings);
    assert(saved.path().filename() == "settings.toml");
    assert(saved.path().parent_path() == stowage::application::persistentFor<game::Settings>().projectDirPath());

    auto loaded = stowage::application::load<game::Settings>();
    assert(loaded.volume == 80);
    assert(loaded.language == "pt-BR");

    std::cout << "[Test] Each declaration keeps its own location and format..." << std::endl;
    game::SaveSlot slot{{1, 2, 3}, "forest"};
    stowage::application::save(slot);
    auto handle = stowage::application::persistentFor<game::SaveSlot>();
    assert(handle.fileName() == "slot.cbor");
    assert(handle.binding().compressed);
    assert(fs::exists(handle.absolutePath()));
    assert(handle.absolutePath().parent_path().filename() == "slot1");

    auto restored = stowage::application::load<game::SaveSlot>();
    assert(restored.inventory == slot.inventory);
    assert(restored.zone == "forest");

    // Explicit handles with the same binding see the same file.
    stowage::application::Persistent<game::Settings, stowage::infrastructure::codecs::TomlCodec> explicitHandle(
        stowage::application::FileBinding<game::Settings>::binding());
    assert(explicitHandle.absolutePath() == saved.path());
    assert(explicitHandle.load().volume == 80);

    std::cout << "[PASS] Declaration Test Passed!" << std::endl;
    return 0;
}
