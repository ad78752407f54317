#include "internal/cache/content_cache.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/cache_keys.hpp"
#include "internal/db/memory/memory_artifact_repository.hpp"

namespace {

using colguard::cache::ArtifactKind;
using colguard::cache::CacheKeys;
using colguard::cache::ContentCache;
using colguard::db::memory::MemoryArtifactRepository;
using colguard::model::Reference;
using colguard::model::ReferenceKind;

const std::string kRenderKey(64, 'a');
const std::string kLineageKey(64, 'b');
const std::string kDigest(64, 'd');

colguard::render::RenderResult MakeRender() {
  colguard::render::RenderResult result;
  result.sql         = "select * from analytics.stg_orders";
  result.references  = {Reference{ReferenceKind::kModel, "", "stg_orders"}, Reference{ReferenceKind::kSource, "jaffle", "orders"}};
  result.macros_used = {"cents_to_dollars"};
  return result;
}

void WriteRaw(MemoryArtifactRepository& repo, const std::string& key, const std::string& kind, const std::string& payload) {
  auto tx     = repo.Begin();
  auto result = repo.UpsertArtifact(*tx, colguard::db::model::ArtifactRecord{key, kind, payload, 1});
  assert(result);
  tx->Commit();
}

void TestMissOnEmptyStore() {
  ContentCache cache(std::make_shared<MemoryArtifactRepository>());
  assert(cache.Load() == 0);
  assert(!cache.GetRendered(kRenderKey).has_value());

  const auto stats = cache.Stats();
  assert(stats.misses == 1 && stats.hits == 0 && stats.corrupt == 0);
}

void TestPutFlushReload() {
  auto repo = std::make_shared<MemoryArtifactRepository>();

  {
    ContentCache cache(repo);
    cache.Put(kRenderKey, colguard::cache::EncodeRendered("orders", MakeRender(), kDigest));

    const auto hit = cache.GetRendered(kRenderKey);
    assert(hit.has_value());
    assert(hit->result.sql == MakeRender().sql);
    assert(hit->result.references == MakeRender().references);
    assert(hit->macros_digest == kDigest);

    assert(cache.Flush());
    assert(cache.Stats().writes == 1);

    // nothing new to write
    assert(cache.Flush());
    assert(cache.Stats().writes == 1);
  }

  ContentCache reloaded(repo);
  assert(reloaded.Load() == 1);
  assert(reloaded.Size() == 1);

  const auto hit = reloaded.GetRendered(kRenderKey);
  assert(hit.has_value());
  assert(hit->result.macros_used == MakeRender().macros_used);
  assert(reloaded.Stats().hits == 1);
}

void TestWrongKindIsAMiss() {
  ContentCache cache(std::make_shared<MemoryArtifactRepository>());
  cache.Put(kRenderKey, colguard::cache::EncodeRendered("orders", MakeRender(), kDigest));

  assert(!cache.GetLineage(kRenderKey).has_value());
  assert(cache.Stats().corrupt == 1);
  assert(cache.Get(kRenderKey, ArtifactKind::kRendered).has_value());
}

void TestUnusableRowsAreMisses() {
  auto repo = std::make_shared<MemoryArtifactRepository>();
  WriteRaw(*repo, kLineageKey, "lineage", std::string("\xff\xff\xff", 3));

  colguard::model::ModelLineage lineage;
  lineage.model = "orders";
  auto stale    = colguard::cache::EncodeLineage(lineage);
  stale.set_format_version(colguard::cache::kArtifactFormatVersion + 1);
  std::string payload;
  assert(stale.SerializeToString(&payload));
  WriteRaw(*repo, kRenderKey, "lineage", payload);

  ContentCache cache(repo);
  assert(cache.Load() == 2);
  assert(!cache.GetLineage(kLineageKey).has_value());
  assert(!cache.GetLineage(kRenderKey).has_value());

  const auto stats = cache.Stats();
  assert(stats.corrupt == 2);
  assert(stats.misses == 2);

  // A fresh artifact replaces the bad row.
  cache.Put(kLineageKey, colguard::cache::EncodeLineage(lineage));
  assert(cache.GetLineage(kLineageKey).has_value());
}

void TestRejectsInvalidUse() {
  bool threw = false;
  try {
    ContentCache cache(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  ContentCache cache(std::make_shared<MemoryArtifactRepository>());
  threw = false;
  try {
    cache.Put(kRenderKey, colguard::v1::CacheArtifact{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestKeysFollowContent() {
  colguard::model::Project project;
  project.vars["start_date"] = "2020-01-01";

  colguard::model::Model orders;
  orders.name    = "orders";
  orders.raw_sql = "select 1";

  colguard::render::RenderSettings settings;
  const CacheKeys keys(project, settings, "ansi");

  const auto fp = keys.ModelFingerprint(orders, kDigest, {"p1", "p2"});
  assert(fp.size() == 64);
  assert(fp == keys.ModelFingerprint(orders, kDigest, {"p2", "p1"}));
  assert(fp != keys.ModelFingerprint(orders, kDigest, {"p1", "p3"}));
  assert(fp != keys.ModelFingerprint(orders, std::string(64, 'e'), {"p1", "p2"}));
  assert(keys.RenderKey(orders) == CacheKeys(project, settings, "ansi").RenderKey(orders));

  auto documented = orders;
  documented.docs = colguard::model::ColumnDocs{colguard::model::ColumnDoc{"id", ""}};
  assert(keys.ModelFingerprint(documented, kDigest, {"p1", "p2"}) != fp);

  assert(keys.LineageKey(fp) != CacheKeys(project, settings, "snowflake").LineageKey(fp));
  assert(keys.LineageKey(fp) != keys.ValidationKey(fp));

  project.vars["start_date"] = "2021-01-01";
  const CacheKeys changed(project, settings, "ansi");
  assert(changed.ContextFingerprint() != keys.ContextFingerprint());
  assert(changed.RenderKey(orders) != keys.RenderKey(orders));

  // Own content only; upstream and macro changes are reported separately.
  const auto content = keys.ContentFingerprint(orders);
  assert(content == keys.ContentFingerprint(orders));
  assert(content != keys.ContentFingerprint(documented));
  assert(content != changed.ContentFingerprint(orders));
  assert(keys.StateKey("orders") == changed.StateKey("orders"));
  assert(keys.StateKey("orders") != keys.StateKey("customers"));
}

void TestModelStateSurvivesReload() {
  auto repo = std::make_shared<MemoryArtifactRepository>();
  const std::string key(64, 's');

  colguard::cache::ModelState state;
  state.model                        = "orders";
  state.content_fingerprint          = kDigest;
  state.macro_fingerprints["cents"]  = std::string(64, 'c');
  state.macro_fingerprints["dollar"] = std::string(64, 'e');
  state.analyzed_at_ms               = 1700000000000;
  state.failed                       = true;

  {
    ContentCache cache(repo);
    cache.Put(key, colguard::cache::EncodeState(state));
    assert(cache.Flush());
  }

  ContentCache reloaded(repo);
  assert(reloaded.Load() == 1);
  assert(!reloaded.GetRendered(key).has_value());

  const auto hit = reloaded.GetState(key);
  assert(hit.has_value());
  assert(hit->model == "orders");
  assert(hit->content_fingerprint == kDigest);
  assert(hit->macro_fingerprints == state.macro_fingerprints);
  assert(hit->analyzed_at_ms == 1700000000000);
  assert(hit->failed);
}

void TestMacroFingerprintsArePerMacro() {
  colguard::model::Project project;
  project.macros["used"]   = colguard::model::Macro{"used", {}, "a", "macros/m.sql"};
  project.macros["unused"] = colguard::model::Macro{"unused", {}, "b", "macros/m.sql"};

  colguard::model::Model orders;
  orders.name    = "orders";
  orders.raw_sql = "select {{ used() }}";

  colguard::render::RenderSettings settings;
  const CacheKeys before(project, settings, "ansi");

  project.macros["unused"].body = "changed";
  const CacheKeys after_unused(project, settings, "ansi");
  assert(after_unused.RenderKey(orders) == before.RenderKey(orders));
  assert(after_unused.MacrosDigest({"used"}) == before.MacrosDigest({"used"}));
  assert(after_unused.MacroFingerprint("unused") != before.MacroFingerprint("unused"));

  project.macros["used"].body = "changed";
  const CacheKeys after_used(project, settings, "ansi");
  assert(after_used.MacrosDigest({"used"}) != before.MacrosDigest({"used"}));

  // Defining a macro that was looked up and missing is a change too.
  assert(before.MacroFingerprint("later") == after_used.MacroFingerprint("later"));
  project.macros["later"] = colguard::model::Macro{"later", {}, "x", "macros/m.sql"};
  assert(CacheKeys(project, settings, "ansi").MacroFingerprint("later") != before.MacroFingerprint("later"));
}

void TestPruneDropsSupersededRows() {
  auto              repo = std::make_shared<MemoryArtifactRepository>();
  const std::string old_key(64, '1');
  const std::string new_key(64, '2');
  const std::string kept_key(64, '3');

  {
    ContentCache cache(repo);
    cache.Put(old_key, colguard::cache::EncodeRendered("orders", MakeRender(), kDigest));
    cache.Put(kept_key, colguard::cache::EncodeRendered("customers", MakeRender(), kDigest));
    assert(cache.Flush());
  }

  // Next run: orders got a new fingerprint, customers is a hit.
  ContentCache cache(repo);
  assert(cache.Load() == 2);
  assert(cache.GetRendered(kept_key).has_value());
  cache.Put(new_key, colguard::cache::EncodeRendered("orders", MakeRender(), kDigest));

  assert(cache.PruneUntouched() == 1);
  assert(cache.Size() == 2);
  assert(!cache.GetRendered(old_key).has_value());
  assert(cache.Flush());
  assert(cache.Stats().deletes == 1);

  auto tx   = repo->Begin();
  auto rows = repo->ListArtifacts(*tx);
  tx->Commit();
  assert(rows.size() == 2);
  for (const auto& row : rows) {
    assert(row.key != old_key);
  }

  // The prune reset the touched set.
  assert(cache.PruneUntouched() == 2);
  assert(cache.Size() == 0);
}

} // namespace

int main() {
  TestMissOnEmptyStore();
  TestPutFlushReload();
  TestWrongKindIsAMiss();
  TestUnusableRowsAreMisses();
  TestRejectsInvalidUse();
  TestKeysFollowContent();
  TestMacroFingerprintsArePerMacro();
  TestModelStateSurvivesReload();
  TestPruneDropsSupersededRows();

  std::cout << "colguard_unit_content_cache: pass\n";
  return 0;
}
