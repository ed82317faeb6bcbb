/** \file RenderBackend.hpp
 *  Backends replaying a PageSet: multi-page PDF file or a raster image of one page.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Page.hpp"
#include <QImage>
#include <QString>

namespace QtGridSheet {

/** Synchronous sink for a finished page set. Failures are reported, never retried. */
class QTGRIDSHEET_EXPORT RenderBackend {
public:
    virtual ~RenderBackend() = default;
    /** Render all pages this backend handles. false on backend failure (see errorString()). */
    virtual bool render(const PageSet &pages) = 0;
    QString errorString() const { return m_error; }

protected:
    void setErrorString(QString e) { m_error = std::move(e); }

private:
    QString m_error;
};

/** Writes every page to a PDF file through QPdfWriter (72 dpi, so one logical unit is one point). */
class QTGRIDSHEET_EXPORT PdfBackend : public RenderBackend {
public:
    explicit PdfBackend(QString outputPath) : m_path(std::move(outputPath)) {}
    bool render(const PageSet &pages) override;

private:
    QString m_path;
};

/** Rasterizes a single page (default page 1) onto a white QImage at the given resolution. */
class QTGRIDSHEET_EXPORT ImageBackend : public RenderBackend {
public:
    explicit ImageBackend(int dpi = 144, int pageNumber = 1) : m_dpi(dpi), m_pageNumber(pageNumber) {}
    bool render(const PageSet &pages) override;
    const QImage & image() const { return m_image; }

private:
    int m_dpi;
    int m_pageNumber;
    QImage m_image;
};

} // namespace QtGridSheet
