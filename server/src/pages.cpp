#include "qrdrop/server/pages.hpp"

#include <string_view>

#include "qrdrop/encoding.hpp"
#include "qrdrop/server/route_handlers.hpp"

namespace qrdrop::server::pages
{

    namespace
    {

        constexpr std::string_view kPageStyle = R"css(
        * { margin: 0; padding: 0; box-sizing: border-box; }
        body { max-width: 800px; margin: 2rem auto; padding: 0 1rem; font-family: sans-serif; }
        h1 { text-align: center; margin-bottom: 2rem; font-size: 24px; }
        .nav-link { margin-top: 2rem; text-align: center; }
        .nav-link a { color: #4285f4; text-decoration: none; padding: 0.8rem 1.5rem;
                      border: 1px solid #4285f4; border-radius: 4px; font-size: 16px; }
        .nav-link a:hover { background: #4285f4; color: white; }
)css";

        constexpr std::string_view kUploadStyle = R"css(
        .upload-container { border: 2px dashed #ccc; padding: 3rem 2rem; text-align: center;
                            border-radius: 8px; margin-bottom: 2rem; }
        #file-input { display: none; }
        .select-btn, .upload-btn { padding: 1.2rem 3rem; border: none; border-radius: 8px; color: white;
                                   cursor: pointer; margin: 0.8rem; font-size: 18px; font-weight: bold;
                                   min-width: 200px; height: 60px; }
        .select-btn { background: #4285f4; }
        .upload-btn { background: #0f9d58; }
        .progress-item { margin: 1rem 0; padding: 1rem; border: 1px solid #eee; border-radius: 4px; }
        .progress-bar { height: 20px; background: #eee; border-radius: 10px; overflow: hidden; margin-top: 0.5rem; }
        .progress-fill { height: 100%; background: #4285f4; width: 0%; transition: width 0.3s ease; }
        .saved-text { color: #666; font-size: 14px; margin-top: 0.3rem; }
)css";

        // Browser side of the upload: one POST per file, each with its own uploadId. The
        // request's own progress drives the bar; /progress reports what the server has written.
        constexpr std::string_view kUploadScript = R"js(
        let files = [];
        const fileInput = document.getElementById('file-input');
        const uploadBtn = document.getElementById('upload-btn');
        const fileList = document.getElementById('file-list');

        fileInput.addEventListener('change', function (e) {
            files = Array.from(e.target.files);
            if (files.length === 0) return;
            uploadBtn.style.display = 'inline-block';
            fileList.innerHTML = '';
            files.forEach((file, index) => {
                const item = document.createElement('div');
                item.className = 'progress-item';
                const title = document.createElement('div');
                title.textContent = file.name + ' (' + formatSize(file.size) + ')';
                item.appendChild(title);
                item.insertAdjacentHTML('beforeend',
                    '<div class="progress-bar"><div class="progress-fill" id="progress-' + index + '"></div></div>' +
                    '<div id="progress-text-' + index + '">0%</div>' +
                    '<div class="saved-text" id="saved-text-' + index + '"></div>');
                fileList.appendChild(item);
            });
        });

        function formatSize(bytes) {
            if (bytes < 1024) return bytes + ' B';
            if (bytes < 1048576) return (bytes / 1024).toFixed(1) + ' KB';
            return (bytes / 1048576).toFixed(1) + ' MB';
        }

        function newUploadId() {
            return Date.now().toString(36) + '-' + Math.random().toString(36).substring(2, 12);
        }

        function pollSaved(uploadId, index) {
            return setInterval(function () {
                fetch('/progress?uploadId=' + encodeURIComponent(uploadId))
                    .then(r => r.json())
                    .then(p => {
                        if (p.total > 0) {
                            document.getElementById('saved-text-' + index).textContent =
                                'Saved ' + formatSize(p.uploaded) + ' of ' + formatSize(p.total);
                        }
                    })
                    .catch(() => {});
            }, 500);
        }

        function uploadFiles() {
            files.forEach((file, index) => {
                const formData = new FormData();
                formData.append('file', file);
                const uploadId = newUploadId();
                const poller = pollSaved(uploadId, index);

                const xhr = new XMLHttpRequest();
                xhr.open('POST', '/upload?uploadId=' + encodeURIComponent(uploadId), true);
                xhr.upload.addEventListener('progress', function (e) {
                    if (e.lengthComputable) {
                        updateProgress(index, (e.loaded / e.total) * 100);
                    }
                });
                xhr.onload = function () {
                    clearInterval(poller);
                    if (xhr.status === 200) {
                        updateProgress(index, 100, 'Upload complete');
                    } else {
                        updateProgress(index, 0, 'Upload failed: ' + xhr.responseText);
                    }
                };
                xhr.onerror = function () {
                    clearInterval(poller);
                    updateProgress(index, 0, 'Upload failed (network error)');
                };
                xhr.send(formData);
            });
            uploadBtn.style.display = 'none';
            fileInput.value = '';
        }

        function updateProgress(index, percent, text = '') {
            const fill = document.getElementById('progress-' + index);
            const label = document.getElementById('progress-text-' + index);
            fill.style.width = percent + '%';
            label.textContent = text || Math.round(percent) + '%';
            if (text.startsWith('Upload failed')) fill.style.backgroundColor = '#ea4335';
            if (text === 'Upload complete') fill.style.backgroundColor = '#0f9d58';
        }
)js";

        constexpr std::string_view kDownloadStyle = R"css(
        .file-list-container { margin-top: 2rem; border: 1px solid #eee; border-radius: 8px; overflow: hidden; }
        .file-list-header { display: flex; background: #4285f4; color: white; font-weight: bold; font-size: 16px; }
        .file-list-item { display: flex; border-bottom: 1px solid #eee; align-items: stretch; }
        .file-list-item:last-child { border-bottom: none; }
        .col-name { flex: 1; padding: 1.2rem 1rem; font-size: 16px; line-height: 1.6; white-space: normal;
                    word-wrap: break-word; word-break: break-all; align-self: center; }
        .col-size { width: 100px; padding: 1.2rem 1rem; text-align: center; white-space: nowrap;
                    font-size: 16px; align-self: center; }
        .col-op { width: 100px; padding: 1.2rem 1rem; text-align: center; align-self: center; }
        .download-btn { display: inline-block; background: #4285f4; color: white; padding: 0.8rem 1.5rem;
                        text-decoration: none; border-radius: 6px; white-space: nowrap; font-size: 16px; }
        .empty-tip { padding: 2rem; text-align: center; color: #999; font-size: 16px; }
)css";

        void open_document(std::string &html, std::string_view title, std::string_view extra_style)
        {
            html += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
                    "    <meta charset=\"UTF-8\">\n"
                    "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
                    "    <title>";
            html += title;
            html += "</title>\n    <style>";
            html += kPageStyle;
            html += extra_style;
            html += "    </style>\n</head>\n<body>\n";
        }

    } // namespace

    std::string render_upload_page()
    {
        std::string html;
        open_document(html, "Upload files", kUploadStyle);
        html += R"html(    <h1>Upload files</h1>
    <div class="upload-container">
        <button class="select-btn" onclick="document.getElementById('file-input').click()">Choose files</button>
        <input type="file" id="file-input" multiple>
        <button class="upload-btn" id="upload-btn" onclick="uploadFiles()" style="display:none;">Start upload</button>
    </div>
    <div id="file-list"></div>
    <div class="nav-link">
        <a href=")html";
        html += routes::kDownloadPage;
        html += R"html(">Go to the download page</a>
    </div>
    <script>)html";
        html += kUploadScript;
        html += "    </script>\n</body>\n</html>\n";
        return html;
    }

    std::string render_download_page(const std::vector<DownloadFile> &files)
    {
        std::string html;
        open_document(html, "Files to download", kDownloadStyle);
        html += R"html(    <h1>Files to download</h1>
    <div class="file-list-container">
        <div class="file-list-header">
            <div class="col-name">File name</div>
            <div class="col-size">Size (KB)</div>
            <div class="col-op">Action</div>
        </div>
)html";

        if (files.empty())
        {
            html += "        <div class=\"empty-tip\">No files available for download</div>\n";
        }
        for (const auto &file : files)
        {
            const auto name = encoding::html_escape(file.display_name);
            html += "        <div class=\"file-list-item\">\n";
            html += "            <div class=\"col-name\">" + name + "</div>\n";
            html += "            <div class=\"col-size\">" + std::to_string(file.size_kb) + "</div>\n";
            html += "            <div class=\"col-op\"><a class=\"download-btn\" download=\"" + name + "\" href=\"";
            html += routes::kDownload;
            html += "?file=" + encoding::percent_encode(file.display_name) + "\">Download</a></div>\n";
            html += "        </div>\n";
        }

        html += R"html(    </div>
    <div class="nav-link">
        <a href=")html";
        html += routes::kIndex;
        html += R"html(">Go to the upload page</a>
    </div>
</body>
</html>
)html";
        return html;
    }

} // namespace qrdrop::server::pages
