#include "uhi/Catalog.hpp"

#include "uhi/Json.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>

namespace uhi {

namespace {

void SortStack(std::vector<Acquisition>& items)
{
  std::stable_sort(items.begin(), items.end(), [](const Acquisition& a, const Acquisition& b) {
    if (a.date != b.date) return a.date < b.date;
    return a.id < b.id;
  });
}

bool MissingBand(const CollectionQuery& q, const std::string& id, PipelineError& err)
{
  err.set(PipelineErrorKind::InvalidInput, "catalog", "acquisition has no band '" + q.band + "'");
  err.with("collection", q.collection).with("acquisition", id);
  return false;
}

} // namespace

std::optional<double> Acquisition::property(const std::string& name) const
{
  const auto it = properties.find(name);
  if (it == properties.end()) return std::nullopt;
  return it->second;
}

const Raster* Acquisition::band(const std::string& name) const
{
  const auto it = bands.find(name);
  return it == bands.end() ? nullptr : &it->second;
}

bool MatchesMetadata(const CollectionQuery& q, const CivilDate& date, const std::map<std::string, double>& props)
{
  if (q.dates && !q.dates->contains(date)) return false;
  if (q.months && !q.months->contains(date.month)) return false;
  if (q.below) {
    const auto it = props.find(q.below->name);
    if (it == props.end()) return false;
    if (!(it->second < q.below->threshold)) return false;
  }
  return true;
}

// MemoryCatalog ---------------------------------------------------------------------------------

void MemoryCatalog::add(const std::string& collection, Acquisition a)
{
  m_collections[collection].push_back(std::move(a));
}

bool MemoryCatalog::query(const CollectionQuery& q, RasterStack& out, PipelineError& err) const
{
  out = RasterStack{};
  out.collection = q.collection;

  const auto it = m_collections.find(q.collection);
  if (it == m_collections.end()) return true;

  for (const Acquisition& a : it->second) {
    if (!MatchesMetadata(q, a.date, a.properties)) continue;
    const Raster* r = a.band(q.band);
    if (!r) return MissingBand(q, a.id, err);
    if (q.bounds && !r->grid.bounds().intersects(*q.bounds)) continue;

    Acquisition sel;
    sel.id = a.id;
    sel.date = a.date;
    sel.properties = a.properties;
    sel.bands.emplace(q.band, *r);
    out.items.push_back(std::move(sel));
  }

  SortStack(out.items);
  return true;
}

// DirectoryCatalog ------------------------------------------------------------------------------

bool DirectoryCatalog::open(const std::string& dir, std::string& outError)
{
  m_dir = dir;
  m_collections.clear();

  const std::filesystem::path manifest = std::filesystem::path(dir) / "catalog.json";
  JsonValue root;
  if (!ReadJsonFile(manifest.string(), root, outError)) return false;

  const JsonValue* cols = FindJsonMember(root, "collections");
  if (!cols || !cols->isObject()) {
    outError = manifest.string() + ": missing 'collections' object";
    return false;
  }

  for (const auto& kv : cols->objectValue) {
    if (!kv.second.isArray()) {
      outError = "collection '" + kv.first + "' must be an array";
      return false;
    }
    std::vector<Entry>& entries = m_collections[kv.first];
    for (const JsonValue& item : kv.second.arrayValue) {
      Entry e;
      const JsonValue* id = FindJsonMember(item, "id");
      const JsonValue* date = FindJsonMember(item, "date");
      const JsonValue* bands = FindJsonMember(item, "bands");
      if (!id || !id->isString() || !date || !date->isString() || !bands || !bands->isObject()) {
        outError = "collection '" + kv.first + "': each element needs string 'id', 'date' and object 'bands'";
        return false;
      }
      e.id = id->stringValue;
      if (!ParseIsoDate(date->stringValue, e.date)) {
        outError = "acquisition '" + e.id + "': invalid date '" + date->stringValue + "'";
        return false;
      }
      for (const auto& b : bands->objectValue) {
        if (!b.second.isString()) {
          outError = "acquisition '" + e.id + "': band paths must be strings";
          return false;
        }
        e.bandFiles[b.first] = b.second.stringValue;
      }
      if (const JsonValue* props = FindJsonMember(item, "properties")) {
        if (!props->isObject()) {
          outError = "acquisition '" + e.id + "': 'properties' must be an object";
          return false;
        }
        // Non-numeric / null properties are treated as absent.
        for (const auto& p : props->objectValue) {
          if (p.second.isNumber() && std::isfinite(p.second.numberValue)) e.properties[p.first] = p.second.numberValue;
        }
      }
      entries.push_back(std::move(e));
    }
  }
  return true;
}

std::size_t DirectoryCatalog::acquisitionCount() const
{
  std::size_t n = 0;
  for (const auto& kv : m_collections) n += kv.second.size();
  return n;
}

bool DirectoryCatalog::query(const CollectionQuery& q, RasterStack& out, PipelineError& err) const
{
  out = RasterStack{};
  out.collection = q.collection;

  const auto it = m_collections.find(q.collection);
  if (it == m_collections.end()) return true;

  for (const Entry& e : it->second) {
    if (!MatchesMetadata(q, e.date, e.properties)) continue;
    const auto bf = e.bandFiles.find(q.band);
    if (bf == e.bandFiles.end()) return MissingBand(q, e.id, err);

    const std::filesystem::path p = std::filesystem::path(m_dir) / bf->second;
    Raster r;
    std::string ioErr;
    if (!ReadRasterJsonFile(p.string(), r, ioErr)) {
      err.set(PipelineErrorKind::Io, "catalog", ioErr);
      err.with("collection", q.collection).with("acquisition", e.id);
      return false;
    }
    if (q.bounds && !r.grid.bounds().intersects(*q.bounds)) continue;

    Acquisition a;
    a.id = e.id;
    a.date = e.date;
    a.properties = e.properties;
    a.bands.emplace(q.band, std::move(r));
    out.items.push_back(std::move(a));
  }

  SortStack(out.items);
  return true;
}

} // namespace uhi
