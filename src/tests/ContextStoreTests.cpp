// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <store/ContextStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "TempDirectory.hpp"

using namespace mcprt;

TEST_CASE("ContextStore creates the directory layout", "[context]")
{
    auto const dir = TempDirectory();
    auto const store = ContextStore(dir.path());

    CHECK(std::filesystem::is_directory(dir / "contexts"));
    CHECK(std::filesystem::is_directory(dir / "functions"));
    CHECK(std::filesystem::is_directory(dir / "schemas"));
}

TEST_CASE("ContextStore create and get", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    SECTION("with a generated id")
    {
        auto const id = store.create(nlohmann::json { { "user", "ada" } });
        REQUIRE(id.has_value());
        CHECK(id->size() == 36);

        auto const data = store.get(*id);
        REQUIRE(data.has_value());
        CHECK((*data)["user"] == "ada");
        CHECK(!data->contains("_metadata"));
    }

    SECTION("with a given id")
    {
        auto const id = store.create(nlohmann::json::object(), "session");
        REQUIRE(id.has_value());
        CHECK(*id == "session");
        CHECK(store.exists("session"));

        auto const record = store.getRecord("session");
        REQUIRE(record.has_value());
        CHECK(record->metadata.id == "session");
        CHECK(!record->metadata.createdAt.empty());
        CHECK(record->metadata.createdAt == record->metadata.updatedAt);
    }

    SECTION("rejects non-object data and invalid ids")
    {
        auto const notObject = store.create(nlohmann::json::array());
        REQUIRE(!notObject.has_value());
        CHECK(notObject.error().code == ErrorCode::InvalidArgument);

        auto const badId = store.create(nlohmann::json::object(), "../escape");
        REQUIRE(!badId.has_value());
        CHECK(badId.error().code == ErrorCode::InvalidArgument);
    }

    CHECK(!store.get("unknown").has_value());
}

TEST_CASE("ContextStore save merges by default", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    REQUIRE(store.create(nlohmann::json { { "llm_config", { { "provider", "local" }, { "model", "a" } } } }, "c1"));
    auto const createdAt = store.getRecord("c1")->metadata.createdAt;

    REQUIRE(store.save("c1", nlohmann::json { { "llm_config", { { "model", "b" } } }, { "extra", 1 } }));

    auto const data = store.get("c1");
    REQUIRE(data.has_value());
    CHECK((*data)["llm_config"]["provider"] == "local");
    CHECK((*data)["llm_config"]["model"] == "b");
    CHECK((*data)["extra"] == 1);
    CHECK(store.getRecord("c1")->metadata.createdAt == createdAt);
}

TEST_CASE("ContextStore merge recurses into objects and replaces leaves", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    REQUIRE(store.create(nlohmann::json { { "a", { { "x", 1 } } } }, "law"));

    REQUIRE(store.save("law", nlohmann::json { { "a", { { "y", 2 } } } }));
    CHECK(*store.get("law") == nlohmann::json { { "a", { { "x", 1 }, { "y", 2 } } } });

    REQUIRE(store.save("law", nlohmann::json { { "a", { { "x", 3 } } } }));
    CHECK(*store.get("law") == nlohmann::json { { "a", { { "x", 3 }, { "y", 2 } } } });
}

TEST_CASE("ContextStore save without merge replaces data but keeps the creation time", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    REQUIRE(store.create(nlohmann::json { { "a", 1 }, { "b", 2 } }, "c1"));
    auto const createdAt = store.getRecord("c1")->metadata.createdAt;

    REQUIRE(store.save("c1", nlohmann::json { { "c", 3 } }, false));

    auto const record = store.getRecord("c1");
    REQUIRE(record.has_value());
    CHECK(record->data == nlohmann::json { { "c", 3 } });
    CHECK(record->metadata.createdAt == createdAt);
}

TEST_CASE("ContextStore save creates unknown contexts and rejects non-objects", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    CHECK(store.save("fresh", nlohmann::json { { "x", true } }));
    CHECK(store.exists("fresh"));
    CHECK(!store.save("fresh", nlohmann::json("text")));
    CHECK(!store.save("a/b", nlohmann::json::object()));
}

TEST_CASE("ContextStore remove and list", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    REQUIRE(store.create({}, "zeta"));
    REQUIRE(store.create({}, "alpha"));
    REQUIRE(store.create({}, "mid"));

    CHECK(store.list() == std::vector<std::string> { "alpha", "mid", "zeta" });

    CHECK(store.remove("mid"));
    CHECK(!store.remove("mid"));
    CHECK(store.list() == std::vector<std::string> { "alpha", "zeta" });
}

TEST_CASE("ContextStore function groups", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    auto const functions = nlohmann::json {
        { "lookup", { { "description", "Looks things up" } } },
    };

    CHECK(store.saveFunctionGroup("tools", functions));
    CHECK(!store.saveFunctionGroup("bad", nlohmann::json::array()));

    auto const group = store.getFunctionGroup("tools");
    REQUIRE(group.has_value());
    CHECK(*group == functions);

    CHECK(store.listFunctionGroups() == std::vector<std::string> { "tools" });
    CHECK(store.removeFunctionGroup("tools"));
    CHECK(!store.getFunctionGroup("tools").has_value());
}

TEST_CASE("ContextStore schemas are stored verbatim", "[context]")
{
    auto const dir = TempDirectory();
    auto store = ContextStore(dir.path());

    auto const schema = nlohmann::json { { "type", "object" }, { "required", { "id" } } };
    CHECK(store.saveSchema("record", schema));

    auto const loaded = store.getSchema("record");
    REQUIRE(loaded.has_value());
    CHECK(*loaded == schema);
    CHECK(store.listSchemas() == std::vector<std::string> { "record" });
    CHECK(store.removeSchema("record"));
    CHECK(store.listSchemas().empty());
}

TEST_CASE("ContextStore export and import", "[context]")
{
    auto const dir = TempDirectory();
    auto const exportFile = dir / "export.json";

    {
        auto source = ContextStore(dir / "source");
        REQUIRE(source.create(nlohmann::json { { "v", "source" } }, "shared"));
        REQUIRE(source.create(nlohmann::json { { "v", "only-source" } }, "extra"));
        REQUIRE(source.saveFunctionGroup("tools", nlohmann::json { { "f", nlohmann::json::object() } }));
        REQUIRE(source.saveSchema("s", nlohmann::json { { "type", "string" } }));
        REQUIRE(source.exportAll(exportFile));
    }

    auto const document = json::readFile(exportFile);
    REQUIRE(document.has_value());
    CHECK((*document)["contexts"].contains("shared"));
    CHECK((*document)["functions"].contains("tools"));
    CHECK((*document)["schemas"].contains("s"));

    auto target = ContextStore(dir / "target");
    REQUIRE(target.create(nlohmann::json { { "v", "target" } }, "shared"));

    SECTION("existing entries are kept without overwrite")
    {
        CHECK(target.importAll(exportFile));
        CHECK((*target.get("shared"))["v"] == "target");
        CHECK((*target.get("extra"))["v"] == "only-source");
        CHECK(target.getFunctionGroup("tools").has_value());
        CHECK(target.getSchema("s").has_value());
    }

    SECTION("existing entries are replaced with overwrite")
    {
        CHECK(target.importAll(exportFile, true));
        CHECK((*target.get("shared"))["v"] == "source");
    }

    SECTION("a fresh store receives identical documents")
    {
        auto fresh = ContextStore(dir / "fresh");
        CHECK(fresh.importAll(exportFile));
        CHECK(fresh.list() == std::vector<std::string> { "extra", "shared" });
        CHECK(fresh.getRecord("shared")->metadata.createdAt
              == (*document)["contexts"]["shared"]["_metadata"]["created_at"].get<std::string>());
        CHECK(*fresh.get("shared") == nlohmann::json { { "v", "source" } });
    }

    SECTION("a missing import file fails")
    {
        CHECK(!target.importAll(dir / "missing.json"));
    }
}
