#include "QtGridSheet/RenderBackend.hpp"
#include "engine/PagePainter.hpp"
#include <QSaveFile>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QtMath>
#include <QDebug>

namespace QtGridSheet {

bool PdfBackend::render(const PageSet &pages) {
    if(pages.pageCount() == 0) {
        setErrorString(QStringLiteral("no pages to write to %1").arg(m_path));
        qWarning("PdfBackend: %s", qUtf8Printable(errorString()));
        return false;
    }
    // replaces the target only on commit()
    QSaveFile out(m_path);
    if(!out.open(QIODevice::WriteOnly)) {
        setErrorString(QStringLiteral("cannot open %1: %2").arg(m_path, out.errorString()));
        qWarning("PdfBackend: %s", qUtf8Printable(errorString()));
        return false;
    }
    QPdfWriter writer(&out);
    writer.setResolution(72);
    writer.setPageSize(QPageSize(pages.pageSize(), QPageSize::Point));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setTitle(pages.title);
    writer.setCreator(QStringLiteral("QtGridSheet"));
    QPainter painter;
    if(!painter.begin(&writer)) {
        out.cancelWriting();
        setErrorString(QStringLiteral("cannot start PDF painter for %1").arg(m_path));
        qWarning("PdfBackend: %s", qUtf8Printable(errorString()));
        return false;
    }
    painter.setRenderHint(QPainter::Antialiasing);
    bool first = true;
    for(const auto &page : pages.pages()) {
        if(!first && !writer.newPage()) {
            painter.end();
            out.cancelWriting();
            setErrorString(QStringLiteral("cannot start page %1").arg(page.index()));
            qWarning("PdfBackend: %s", qUtf8Printable(errorString()));
            return false;
        }
        first = false;
        engine::PagePainter::paint(painter, page);
    }
    if(!painter.end() || !out.commit()) {
        setErrorString(QStringLiteral("write failed for %1: %2").arg(m_path, out.errorString()));
        qWarning("PdfBackend: %s", qUtf8Printable(errorString()));
        return false;
    }
    return true;
}

bool ImageBackend::render(const PageSet &pages) {
    m_image = QImage();
    if(m_pageNumber < 1 || m_pageNumber > pages.pageCount()) {
        setErrorString(QStringLiteral("page %1 not available").arg(m_pageNumber));
        return false;
    }
    const qreal scale = m_dpi / 72.0;
    const QSizeF size = pages.pageSize() * scale;
    QImage image(qCeil(size.width()), qCeil(size.height()), QImage::Format_RGB32);
    if(image.isNull()) {
        setErrorString(QStringLiteral("cannot allocate %1x%2 image").arg(size.width()).arg(size.height()));
        return false;
    }
    image.setDotsPerMeterX(qRound(m_dpi / 0.0254));
    image.setDotsPerMeterY(qRound(m_dpi / 0.0254));
    image.fill(Qt::white);
    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.scale(scale, scale);
    engine::PagePainter::paint(painter, pages.pages().at(m_pageNumber - 1));
    painter.end();
    m_image = std::move(image);
    return true;
}

} // namespace QtGridSheet
