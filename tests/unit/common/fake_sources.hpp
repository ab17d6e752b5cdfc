#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "DocumentSource.hpp"

namespace chapters_tests {
    using namespace chapters;

    // Helpers to build outline trees without the variant noise
    inline OutlineNode PageLeaf(std::string title, const int pageIndex) {
        OutlineLeaf leaf;
        leaf.title = std::move(title);
        leaf.dest.pageIndex = pageIndex;
        return leaf;
    }

    inline OutlineNode PageSection(std::string title, const int pageIndex, std::vector<OutlineNode> children) {
        OutlineSection section;
        section.title = std::move(title);
        section.dest.pageIndex = pageIndex;
        section.children = std::move(children);
        return section;
    }

    inline OutlineNode HrefLeaf(std::string title, std::string href) {
        OutlineLeaf leaf;
        leaf.title = std::move(title);
        leaf.dest.href = std::move(href);
        return leaf;
    }

    // In-memory paginated document: pages of text runs plus an optional outline.
    class FakePaginatedSource final : public PaginatedSource {
    public:
        explicit FakePaginatedSource(const int pages, std::string path = "/books/sample.pdf")
            : path_(std::move(path)), pages_(static_cast<size_t>(pages)) {
        }

        std::string FilePath() const override { return path_; }

        int TotalUnits() const override { return static_cast<int>(pages_.size()); }

        std::optional<std::vector<OutlineNode> > ReadOutline() const override {
            ++outlineReads;
            if (throwOnOutline)
                throw std::runtime_error("broken outline");
            return outline;
        }

        std::vector<TextRun> PageTextRuns(const int pageIndex) const override {
            if (pageIndex == brokenPage)
                throw std::runtime_error("cannot load page");
            return pages_.at(static_cast<size_t>(pageIndex));
        }

        void AddRun(const int pageNumber, std::string text, const double size) {
            pages_.at(static_cast<size_t>(pageNumber - 1)).push_back({std::move(text), size});
        }

        // Body text at 11pt on every page
        void FillBody(const std::string &text = "Plain body text that goes on for a while.") {
            for (auto &page: pages_) {
                page.push_back({text, 11.0});
                page.push_back({text, 11.0});
                page.push_back({text, 11.0});
            }
        }

        std::optional<std::vector<OutlineNode> > outline;
        bool throwOnOutline = false;
        int brokenPage = -1;
        mutable int outlineReads = 0;

    private:
        std::string path_;
        std::vector<std::vector<TextRun> > pages_;
    };

    // In-memory archive: spine units and other items keyed by archive path.
    class FakeArchiveSource final : public ArchiveSource {
    public:
        explicit FakeArchiveSource(std::string path = "/books/sample.epub") : path_(std::move(path)) {
        }

        std::string FilePath() const override { return path_; }

        std::optional<std::vector<OutlineNode> > ReadOutline() const override { return outline; }

        const std::vector<std::string> &SpineUnits() const override { return spine_; }

        std::optional<std::string> ReadItem(const std::string &path) const override {
            const auto it = items_.find(path);
            if (it == items_.end())
                return std::nullopt;
            return it->second;
        }

        const ManifestItem *FindItem(const std::string &ref) const override {
            for (const auto &item: manifest_) {
                if (item.path == ref || item.href == ref)
                    return &item;
            }
            return nullptr;
        }

        // Adds a manifest item; href is relative to "OEBPS/".
        void AddItem(const std::string &id, const std::string &path, const std::string &mediaType,
                     std::string data) {
            ManifestItem item;
            item.id = id;
            item.path = path;
            item.href = path.rfind("OEBPS/", 0) == 0 ? path.substr(6) : path;
            item.mediaType = mediaType;
            manifest_.push_back(item);
            items_[path] = std::move(data);
        }

        void AddUnit(const std::string &id, const std::string &path, std::string markup) {
            AddItem(id, path, "application/xhtml+xml", std::move(markup));
            spine_.push_back(path);
        }

        std::optional<std::vector<OutlineNode> > outline;

    private:
        std::string path_;
        std::vector<std::string> spine_;
        std::vector<ManifestItem> manifest_;
        std::map<std::string, std::string> items_;
    };

    inline std::string Xhtml(const std::string &title, const std::string &body) {
        return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
               "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>" + title +
               "</title></head><body>" + body + "</body></html>";
    }
} // namespace chapters_tests
