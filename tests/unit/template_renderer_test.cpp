#include "internal/render/template_renderer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/render/template_parser.hpp"
#include "internal/util/errors.hpp"

namespace {

using colguard::model::Model;
using colguard::model::Project;
using colguard::model::ReferenceKind;
using colguard::model::SourceTable;
using colguard::render::RenderSettings;
using colguard::render::TemplateRenderer;

void AddModel(Project& project, const std::string& name, const std::string& sql) {
  Model m;
  m.name    = name;
  m.path    = name + ".sql";
  m.raw_sql = sql;
  project.models[name] = m;
}

void AddMacros(Project& project, const std::string& text) {
  for (auto& macro : colguard::render::ParseMacroFile(text, "macros/test.sql")) {
    project.macros[macro.name] = macro;
  }
}

Project BaseProject() {
  Project project;
  AddModel(project, "stg_orders", "select 1");
  AddModel(project, "stg_customers", "select 1");

  SourceTable raw;
  raw.source_name = "shop";
  raw.name        = "orders";
  project.sources[raw.NodeKey()] = raw;
  return project;
}

void TestPlainSqlIsIdentity() {
  auto project = BaseProject();
  AddModel(project, "plain", "select id,\n  name -- comment\nfrom somewhere\n");

  TemplateRenderer renderer(project, RenderSettings{});
  auto             result = renderer.Render(*project.FindModel("plain"));
  assert(result.sql == project.FindModel("plain")->raw_sql);
  assert(result.references.empty());
  assert(result.macros_used.empty());
}

void TestRefAndSourceAreSubstitutedAndDeduplicated() {
  auto project = BaseProject();
  AddModel(project, "orders",
           "select * from {{ ref('stg_orders') }} o join {{ source('shop', 'orders') }} s using (id)"
           " join {{ ref(\"stg_orders\") }} again using (id) join {{ ref('pkg', 'stg_customers') }} c using (id)");

  TemplateRenderer renderer(project, RenderSettings{});
  auto             result = renderer.Render(*project.FindModel("orders"));

  assert(result.sql
         == "select * from stg_orders o join shop.orders s using (id) join stg_orders again using (id) join stg_customers c using (id)");
  assert(result.references.size() == 3);
  assert(result.references[0].kind == ReferenceKind::kModel && result.references[0].name == "stg_orders");
  assert(result.references[1].kind == ReferenceKind::kSource && result.references[1].NodeKey() == "shop.orders");
  assert(result.references[2].name == "stg_customers");
}

void TestTargetSchemaQualifiesModelsOnly() {
  auto project = BaseProject();
  AddModel(project, "orders", "select * from {{ ref('stg_orders') }}, {{ source('shop','orders') }} -- {{ this }}");

  RenderSettings settings;
  settings.target_schema = "analytics";
  TemplateRenderer renderer(project, settings);

  auto result = renderer.Render(*project.FindModel("orders"));
  assert(result.sql == "select * from analytics.stg_orders, shop.orders -- analytics.orders");
}

void TestUnknownRefIsUnresolved() {
  auto project = BaseProject();
  AddModel(project, "customers", "select id from {{ ref(\"raw_customers\") }}");

  TemplateRenderer renderer(project, RenderSettings{});
  bool             threw = false;
  try {
    (void)renderer.Render(*project.FindModel("customers"));
  } catch (const colguard::util::UnresolvedReferenceError& e) {
    threw = e.Model() == "customers" && e.Target() == "model 'raw_customers'";
  }
  assert(threw);

  // Sibling models still render.
  auto ok = renderer.Render(*project.FindModel("stg_orders"));
  assert(ok.sql == "select 1");
}

void TestUnknownSourceIsUnresolved() {
  auto project = BaseProject();
  AddModel(project, "bad", "select * from {{ source('shop', 'refunds') }}");

  TemplateRenderer renderer(project, RenderSettings{});
  bool             threw = false;
  try {
    (void)renderer.Render(*project.FindModel("bad"));
  } catch (const colguard::util::UnresolvedReferenceError& e) {
    threw = e.Target() == "source 'shop.refunds'";
  }
  assert(threw);
}

void TestMacrosExpandWithDefaultsAndKeywords() {
  auto project = BaseProject();
  AddMacros(project,
            "{% macro cents_to_dollars(col, scale=2) %}round({{ col }} / 100, {{ scale }}){% endmacro %}\n"
            "{% macro amount(col) %}{{ cents_to_dollars(col) }}{% endmacro %}\n");
  AddModel(project, "payments",
           "select {{ amount('amount_cents') }} as amount, {{ cents_to_dollars('fee', scale=4) }} as fee,"
           " {{ utils.cents_to_dollars(col='tax') }} as tax from {{ ref('stg_orders') }}");

  TemplateRenderer renderer(project, RenderSettings{});
  auto             result = renderer.Render(*project.FindModel("payments"));

  assert(result.sql
         == "select round(amount_cents / 100, 2) as amount, round(fee / 100, 4) as fee, round(tax / 100, 2) as tax from stg_orders");
  assert((result.macros_used == std::vector<std::string>{"amount", "cents_to_dollars"}));
  assert(result.references.size() == 1);
}

void TestMacroBodiesMayReference() {
  auto project = BaseProject();
  AddMacros(project, "{% macro orders_relation() %}{{ ref('stg_orders') }}{% endmacro %}");
  AddModel(project, "m", "select * from {{ orders_relation() }}");

  TemplateRenderer renderer(project, RenderSettings{});
  auto             result = renderer.Render(*project.FindModel("m"));
  assert(result.sql == "select * from stg_orders");
  assert(result.references.size() == 1 && result.references[0].name == "stg_orders");
}

void TestModelLocalMacro() {
  auto project = BaseProject();
  AddModel(project, "local", "{% macro twice(x) %}{{ x }} * 2{% endmacro %}select {{ twice('n') }} as n2");

  TemplateRenderer renderer(project, RenderSettings{});
  auto             result = renderer.Render(*project.FindModel("local"));
  assert(result.sql == "select n * 2 as n2");

  // Model-local macros are part of the model text, not project macros.
  assert(result.macros_used.empty());
}

void TestCyclicMacrosHitTheDepthLimit() {
  auto project = BaseProject();
  AddMacros(project,
            "{% macro ping() %}{{ pong() }}{% endmacro %}"
            "{% macro pong() %}{{ ping() }}{% endmacro %}");
  AddModel(project, "loop", "select {{ ping() }}");

  RenderSettings settings;
  settings.macro_depth_limit = 5;
  TemplateRenderer renderer(project, settings);

  bool threw = false;
  try {
    (void)renderer.Render(*project.FindModel("loop"));
  } catch (const colguard::util::MacroRecursionError& e) {
    threw = e.Model() == "loop" && e.Chain().size() == 6 && e.Chain().front() == "ping" && e.Chain()[1] == "pong";
  }
  assert(threw);
}

void TestVars() {
  auto project           = BaseProject();
  project.vars["region"] = "emea";
  AddModel(project, "v", "select '{{ var('region') }}' as r, {{ var('limit', 10) }} as l");
  AddModel(project, "missing", "select {{ var('nope') }}");

  TemplateRenderer renderer(project, RenderSettings{});
  assert(renderer.Render(*project.FindModel("v")).sql == "select 'emea' as r, 10 as l");

  bool threw = false;
  try {
    (void)renderer.Render(*project.FindModel("missing"));
  } catch (const colguard::util::UnresolvedReferenceError& e) {
    threw = e.Target() == "var 'nope'";
  }
  assert(threw);
}

void TestConfigCommentsAndWhitespaceControl() {
  auto project = BaseProject();
  AddModel(project, "c", "{{ config(materialized='table') }}{# note #}select a   {{- ',' -}}   b");

  TemplateRenderer renderer(project, RenderSettings{});
  assert(renderer.Render(*project.FindModel("c")).sql == "select a,b");
}

void TestConditionalBlocks() {
  auto project         = BaseProject();
  project.vars["mode"] = "y";
  AddModel(project, "inline", "select a {% if true %}, b{% endif %} from t");
  AddModel(project, "chain",
           "select {% if var('mode') == 'x' %}1{% elif var('mode') == 'y' %}2{% else %}3{% endif %}"
           "{% if false %} skipped{% endif %}");

  TemplateRenderer renderer(project, RenderSettings{});
  assert(renderer.Render(*project.FindModel("inline")).sql == "select a , b from t");
  assert(renderer.Render(*project.FindModel("chain")).sql == "select 2");
}

void TestSetStatements() {
  auto project = BaseProject();
  AddModel(project, "list", "{% set cols = ['a'] %}select a from t");
  AddModel(project, "joined", "{% set cols = ['a', 'b'] %}select {{ cols | join(', ') }} from t");
  AddModel(project, "block", "{% set cols %}a, b{% endset %}select {{ cols }} from t");
  AddModel(project, "unpack", "{%- set lo, hi = (1, 10) -%}\nselect * from t where x between {{ lo }} and {{ hi * 2 }}");

  TemplateRenderer renderer(project, RenderSettings{});
  assert(renderer.Render(*project.FindModel("list")).sql == "select a from t");
  assert(renderer.Render(*project.FindModel("joined")).sql == "select a, b from t");
  assert(renderer.Render(*project.FindModel("block")).sql == "select a, b from t");
  assert(renderer.Render(*project.FindModel("unpack")).sql == "select * from t where x between 1 and 20");
}

void TestForLoops() {
  auto project = BaseProject();
  AddModel(project, "cols",
           "select {% for c in ['a', 'b', 'c'] %}{{ c }}{% if not loop.last %}, {% endif %}{% endfor %} from t");
  AddModel(project, "pairs",
           "{% for k, v in {'a': 1, 'b': 2}.items() if v > 1 %}{{ k }}={{ v }}{% endfor %}"
           "{% for x in [] %}{{ x }}{% else %} empty{% endfor %}");
  AddModel(project, "scoped", "{% set n = 0 %}{% for i in range(3) %}{% set n = i %}{% endfor %}{{ n }}");

  TemplateRenderer renderer(project, RenderSettings{});
  assert(renderer.Render(*project.FindModel("cols")).sql == "select a, b, c from t");
  assert(renderer.Render(*project.FindModel("pairs")).sql == "b=2 empty");
  assert(renderer.Render(*project.FindModel("scoped")).sql == "0");
}

void TestDoAndMacroReturn() {
  auto project = BaseProject();
  AddMacros(project,
            "{% macro id_columns(names) %}"
            "{% set out = [] %}{% for c in names %}{% do out.append(c ~ '_id') %}{% endfor %}"
            "{{ return(out) }}"
            "{% endmacro %}");
  AddModel(project, "m", "select {{ id_columns(['order', 'customer']) | join(', ') }} from t");

  TemplateRenderer renderer(project, RenderSettings{});
  auto             result = renderer.Render(*project.FindModel("m"));
  assert(result.sql == "select order_id, customer_id from t");
  assert((result.macros_used == std::vector<std::string>{"id_columns"}));
}

void TestAdapterDispatch() {
  auto project = BaseProject();
  AddMacros(project,
            "{% macro now() %}{{ return(adapter.dispatch('now', 'utils')()) }}{% endmacro %}"
            "{% macro default__now() %}now(){% endmacro %}"
            "{% macro snowflake__now() %}current_timestamp(){% endmacro %}");
  AddModel(project, "m", "select {{ now() }} as at, {{ adapter.quote('id') }}");

  TemplateRenderer fallback(project, RenderSettings{});
  auto             plain = fallback.Render(*project.FindModel("m"));
  assert(plain.sql == "select now() as at, \"id\"");
  assert((plain.macros_used == std::vector<std::string>{"default__now", "now"}));
  assert((plain.macro_lookups == std::vector<std::string>{"default__now", "now"}));

  RenderSettings settings;
  settings.adapter_type = "snowflake";
  TemplateRenderer snowflake(project, settings);
  auto             specific = snowflake.Render(*project.FindModel("m"));
  assert(specific.sql == "select current_timestamp() as at, \"id\"");
  assert((specific.macros_used == std::vector<std::string>{"now", "snowflake__now"}));
  assert((specific.macro_lookups == std::vector<std::string>{"now", "snowflake__now"}));

  settings.adapter_type = "bigquery";
  assert(TemplateRenderer(project, settings).Render(*project.FindModel("m")).sql == "select now() as at, `id`");
}

void TestWarehouseStandIns() {
  auto project = BaseProject();
  AddModel(project, "m",
           "select 1 {% if is_incremental() %}where x > 1 {% endif %}{% if execute %}x {% endif %}"
           "-- {{ target.schema }}.{{ target.type }} {{ run_query('select 1') is none }}"
           "{{ adapter.get_relation(database=none, schema='s', identifier='t') or '' }}");

  RenderSettings settings;
  settings.target_schema = "analytics";
  settings.adapter_type  = "duckdb";
  TemplateRenderer renderer(project, settings);
  assert(renderer.Render(*project.FindModel("m")).sql == "select 1 -- analytics.duckdb True");
}

void TestUnsupportedStatementsAreSyntaxErrors() {
  auto project = BaseProject();
  AddModel(project, "call", "select {% call wrapper() %}1{% endcall %}");
  AddModel(project, "include", "{% include 'other.sql' %}");
  AddModel(project, "unclosed", "select {% if true %}1");
  AddModel(project, "stray", "select 1{% endif %}");
  AddModel(project, "open", "select {{ ref('stg_orders') ");
  AddModel(project, "types", "select {{ 1 + 'a' }}");
  AddModel(project, "toplevel_return", "select {{ return(1) }}");

  TemplateRenderer renderer(project, RenderSettings{});
  for (const auto* name : {"call", "include", "unclosed", "stray", "open", "types", "toplevel_return"}) {
    bool threw = false;
    try {
      (void)renderer.Render(*project.FindModel(name));
    } catch (const colguard::util::TemplateSyntaxError& e) {
      threw = e.Model() == name;
    }
    assert(threw);
  }
}

void TestRenderingIsDeterministic() {
  auto project = BaseProject();
  AddMacros(project, "{% macro pick(c) %}{{ c }}{% endmacro %}");
  AddModel(project, "d", "select {{ pick('x') }} from {{ ref('stg_customers') }} join {{ ref('stg_orders') }} using (id)");

  TemplateRenderer renderer(project, RenderSettings{});
  auto             first  = renderer.Render(*project.FindModel("d"));
  auto             second = renderer.Render(*project.FindModel("d"));
  assert(first.sql == second.sql);
  assert(first.references == second.references);
}

} // namespace

int main() {
  TestPlainSqlIsIdentity();
  TestRefAndSourceAreSubstitutedAndDeduplicated();
  TestTargetSchemaQualifiesModelsOnly();
  TestUnknownRefIsUnresolved();
  TestUnknownSourceIsUnresolved();
  TestMacrosExpandWithDefaultsAndKeywords();
  TestMacroBodiesMayReference();
  TestModelLocalMacro();
  TestCyclicMacrosHitTheDepthLimit();
  TestVars();
  TestConfigCommentsAndWhitespaceControl();
  TestConditionalBlocks();
  TestSetStatements();
  TestForLoops();
  TestDoAndMacroReturn();
  TestAdapterDispatch();
  TestWarehouseStandIns();
  TestUnsupportedStatementsAreSyntaxErrors();
  TestRenderingIsDeterministic();

  std::cout << "colguard_unit_template_renderer: pass\n";
  return 0;
}
