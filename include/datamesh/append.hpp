#pragma once
#include "datamesh/dataset.hpp"
#include "datamesh/datasource.hpp"
#include "datamesh/error.hpp"
#include "datamesh/log.hpp"
#include "datamesh/zarr.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace datamesh {

// Existing metadata for a datasource id, or nullopt when it does not exist.
using DatasourceLookup = std::function<std::optional<Datasource>(const std::string&)>;

// ---------------------------------------------------------------------------
// AppendWriter
//
// Writes a batch onto a chunked array store, resolving overlap with the
// existing values of the append coordinate:
//   - values of the existing coordinate inside [new.front(), new.back()]
//     form the replace range, which is overwritten in place;
//   - whatever the batch holds past the replace range is appended;
//   - a replace range that stops short of the existing end must match the
//     batch's coordinate values exactly.
// Every check runs before the first mutation. The append coordinate must
// be sorted ascending in both the store and the batch.
// ---------------------------------------------------------------------------

class AppendWriter final {
public:
    AppendWriter(std::shared_ptr<Store> store, DatasourceLookup lookup, WriteOptions options = {})
        : store_{std::move(store)}, lookup_{std::move(lookup)}, opts_{std::move(options)}
    {
        if (!store_) throw std::invalid_argument("append: store must not be null");
        if (!lookup_) throw std::invalid_argument("append: datasource lookup must not be null");
    }

    /// Write `data` to datasource `id`. Without `append`, or with
    /// `overwrite`, the store is replaced wholesale. Returns the datasource
    /// metadata with its schema refreshed from the store.
    Datasource write(const std::string& id, const Dataset& data,
                     const std::optional<std::string>& append = std::nullopt, bool overwrite = false)
    {
        if (overwrite) return fresh(id, data, std::nullopt);
        auto existing = lookup_(id);
        if (!append || !existing) return fresh(id, data, std::move(existing));

        append_onto(*existing, data, *append);
        auto ds = std::move(*existing);
        ds.schema = Schema::from_json(open_dataset(store_).schema());
        return ds;
    }

private:
    Datasource fresh(const std::string& id, const Dataset& data, std::optional<Datasource> existing)
    {
        store_->clear();
        write_dataset(store_, data, opts_);
        Logger::debug("append: wrote {} variables to {}", data.variables().size(), id);

        Datasource ds;
        if (existing) {
            ds = std::move(*existing);
        } else {
            ds.id = id;
            ds.driver = std::string(datasource_driver(Container::dataset));
        }
        ds.schema = Schema::from_json(data.schema());
        return ds;
    }

    void append_onto(const Datasource& existing, const Dataset& data, const std::string& coord)
    {
        if (!existing.schema.coords.contains(coord))
            throw WriteError(std::format("Append coordinate {} not in existing zarr", coord));

        auto lazy = open_dataset(store_);
        auto info = lazy.info().find(coord);
        if (info == lazy.info().end())
            throw WriteError(std::format("Append coordinate {} not in existing zarr", coord));
        if (info->second.dims.size() != 1)
            throw WriteError(std::format("Append coordinate {} has more than one dimension", coord));
        const auto dim = info->second.dims.front();

        const auto* incoming = data.find(coord);
        if (!incoming || incoming->dims != std::vector<std::string>{dim})
            throw WriteError(std::format("Append coordinate {} missing from the data or not along '{}'", coord, dim));

        auto current = lazy.load(coord).as_double();
        auto batch = incoming->as_double();
        if (batch.empty()) return;
        require_ascending(current, coord);
        require_ascending(batch, coord);

        // Ascending values make the replace range contiguous.
        std::size_t first = current.size(), count = 0;
        for (std::size_t i = 0; i < current.size(); ++i) {
            if (current[i] >= batch.front() && current[i] <= batch.back()) {
                if (count == 0) first = i;
                ++count;
            }
        }

        std::optional<Dataset> section;
        if (count > 0) {
            if (count > batch.size())
                throw WriteError("Cannot append to zarr with a region that would be smaller than the original");

            std::vector<std::string> fixed;
            for (const auto& name : data.variables())
                if (!data[name].has_dim(dim)) fixed.push_back(name);
            section = data.isel(dim, 0, count).drop_vars(fixed);

            if (first + count < current.size()) {
                auto replaced = (*section)[coord].as_double();
                if (!std::equal(replaced.begin(), replaced.end(), current.begin() + static_cast<std::ptrdiff_t>(first)))
                    throw WriteError(std::format("Data inconsistency on coordinate {} replacing a inner section "
                                                 "of an existing zarr array", coord));
            }
        }

        std::optional<Dataset> tail;
        if (batch.size() > count) tail = data.isel(dim, count, batch.size());

        // The region write keeps every stored shape, so both halves can be
        // checked against the store as it is now.
        try {
            if (section) validate_region(lazy, *section, dim, first);
            if (tail) validate_append(lazy, *tail, dim);
        } catch (const std::invalid_argument& e) {
            throw WriteError(e.what());
        }

        if (section) {
            Logger::debug("append: replacing {} {} values from index {}", count, coord, first);
            write_region(store_, *section, dim, first);
        }
        if (tail) {
            Logger::debug("append: appending {} {} values", batch.size() - count, coord);
            append_dataset(store_, *tail, dim, opts_);
        }
    }

    static void require_ascending(const std::vector<double>& values, const std::string& coord)
    {
        for (std::size_t i = 1; i < values.size(); ++i)
            if (values[i] < values[i - 1])
                throw WriteError(std::format("Append coordinate {} is not sorted ascending", coord));
    }

    std::shared_ptr<Store> store_;
    DatasourceLookup lookup_;
    WriteOptions opts_;
};

} // namespace datamesh
