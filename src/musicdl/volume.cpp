// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <string>
#include <system_error>

#include <gio/gio.h>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

struct MountOperationState {
    GMainLoop* loop{nullptr};
    bool ok{false};
    std::string err;
};

static bool is_under_media_dir(const std::string& path) {
    return path.rfind("/media/", 0) == 0 || path.rfind("/run/media/", 0) == 0;
}

static bool is_removable_mount(GMount* mount, const std::string& root_path) {
    if (g_mount_can_eject(mount)) return true;
    GDrive* drive = g_mount_get_drive(mount);
    if (drive) {
        const bool removable = g_drive_is_removable(drive) || g_drive_is_media_removable(drive);
        g_object_unref(drive);
        if (removable) return true;
    }
    return is_under_media_dir(root_path);
}

// Existing, readable and holding at least one entry.
static bool is_usable_root(const std::string& root_path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_path, ec)) return false;
    std::filesystem::directory_iterator it(root_path, ec);
    if (ec) return false;
    return it != std::filesystem::directory_iterator();
}

static std::string mount_root_path(GMount* mount) {
    GFile* root = g_mount_get_root(mount);
    if (!root) return {};
    char* path = g_file_get_path(root);
    std::string out = to_string_or_empty(path);
    g_free(path);
    g_object_unref(root);
    return out;
}

static void on_mount_operation_finished(
    GObject* source,
    GAsyncResult* result,
    gpointer user_data) {

    auto* state = static_cast<MountOperationState*>(user_data);
    GError* gerr = nullptr;
    GMount* mount = G_MOUNT(source);
    state->ok = g_mount_can_eject(mount)
        ? g_mount_eject_with_operation_finish(mount, result, &gerr)
        : g_mount_unmount_with_operation_finish(mount, result, &gerr);
    if (!state->ok) state->err = gerror_message(gerr, "unknown error");
    g_clear_error(&gerr);
    g_main_loop_quit(state->loop);
}

static char* gio_detect(void* /*user_data*/) {
    GVolumeMonitor* monitor = g_volume_monitor_get();
    if (!monitor) return nullptr;
    GList* mounts = g_volume_monitor_get_mounts(monitor);
    std::string found;
    for (GList* l = mounts; l != nullptr; l = l->next) {
        GMount* mount = G_MOUNT(l->data);
        const std::string root_path = mount_root_path(mount);
        if (root_path.empty()) continue;
        if (!is_removable_mount(mount, root_path)) continue;
        if (!is_usable_root(root_path)) continue;
        found = root_path;
        break;
    }
    g_list_free_full(mounts, g_object_unref);
    g_object_unref(monitor);
    return found.empty() ? nullptr : make_mutable_cstr_copy(found);
}

static int gio_copy(
    void* /*user_data*/,
    const char* file_path,
    const char* dest_dir,
    const char** error) {

    clear_error(error);
    if (!file_path || !dest_dir) {
        set_error(error, "Invalid arguments to volume copy");
        return 0;
    }

    GFile* dir = g_file_new_for_path(dest_dir);
    GError* gerr = nullptr;
    if (!g_file_make_directory_with_parents(dir, nullptr, &gerr)) {
        if (gerr && !g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_EXISTS)) {
            set_error(error,
                "Failed to create " + std::string{dest_dir} + ": " + gerror_message(gerr, "unknown"));
            g_clear_error(&gerr);
            g_object_unref(dir);
            return 0;
        }
        g_clear_error(&gerr);
    }

    GFile* source = g_file_new_for_path(file_path);
    char* base_name = g_file_get_basename(source);
    GFile* target = g_file_get_child(dir, base_name ? base_name : "track");
    g_free(base_name);

    const bool ok = g_file_copy(
        source,
        target,
        G_FILE_COPY_OVERWRITE,
        nullptr,
        nullptr,
        nullptr,
        &gerr);
    if (!ok) {
        set_error(error,
            "Failed to copy " + std::string{file_path} + " to " + std::string{dest_dir} +
            " (" + gerror_message(gerr, "unknown") + ")");
        g_clear_error(&gerr);
    }

    g_object_unref(target);
    g_object_unref(source);
    g_object_unref(dir);
    return ok ? 1 : 0;
}

static int gio_eject(
    void* /*user_data*/,
    const char* volume_root,
    const char** error) {

    clear_error(error);
    if (!volume_root) {
        set_error(error, "Volume root is null");
        return 0;
    }

    // Mount operations complete on this thread's own main context.
    GMainContext* context = g_main_context_new();
    g_main_context_push_thread_default(context);

    GVolumeMonitor* monitor = g_volume_monitor_get();
    GList* mounts = monitor ? g_volume_monitor_get_mounts(monitor) : nullptr;
    GMount* target = nullptr;
    for (GList* l = mounts; l != nullptr; l = l->next) {
        GMount* mount = G_MOUNT(l->data);
        if (mount_root_path(mount) == volume_root) {
            target = G_MOUNT(g_object_ref(mount));
            break;
        }
    }
    g_list_free_full(mounts, g_object_unref);
    if (monitor) g_object_unref(monitor);

    int result = 0;
    if (!target) {
        set_error(error, "No mount found at " + std::string{volume_root});
    } else {
        MountOperationState state{};
        state.loop = g_main_loop_new(context, FALSE);
        if (g_mount_can_eject(target)) {
            g_mount_eject_with_operation(
                target, G_MOUNT_UNMOUNT_NONE, nullptr, nullptr,
                &on_mount_operation_finished, &state);
        } else {
            g_mount_unmount_with_operation(
                target, G_MOUNT_UNMOUNT_NONE, nullptr, nullptr,
                &on_mount_operation_finished, &state);
        }
        g_main_loop_run(state.loop);
        g_main_loop_unref(state.loop);
        if (state.ok) {
            result = 1;
        } else {
            set_error(error, "Failed to eject " + std::string{volume_root} + ": " + state.err);
        }
        g_object_unref(target);
    }

    g_main_context_pop_thread_default(context);
    g_main_context_unref(context);
    return result;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void musicdl_default_volume_manager(MusicDlVolumeManager* out) {
    if (!out) return;
    out->user_data = nullptr;
    out->detect = &gio_detect;
    out->copy = &gio_copy;
    out->eject = &gio_eject;
}

MusicDlSyncResult musicdl_try_sync(
    const char* file_path,
    const char* artist,
    bool enabled,
    const MusicDlVolumeManager* manager,
    char** volume_root,
    const char** error) {

    clear_error(error);
    if (volume_root) *volume_root = nullptr;
    if (!enabled) return MUSICDL_SYNC_DISABLED;
    if (!file_path) {
        set_error(error, "File path is null");
        return MUSICDL_SYNC_ERROR;
    }

    MusicDlVolumeManager mgr{};
    if (manager) mgr = *manager;
    else musicdl_default_volume_manager(&mgr);
    if (!mgr.detect || !mgr.copy) {
        set_error(error, "Volume manager is incomplete");
        return MUSICDL_SYNC_ERROR;
    }

    char* root = mgr.detect(mgr.user_data);
    if (!root) return MUSICDL_SYNC_NO_VOLUME;

    const std::filesystem::path dest_dir =
        std::filesystem::path(root) / "Music" / sanitize_path_component(to_string_or_empty(artist));

    const char* copy_err = nullptr;
    if (!mgr.copy(mgr.user_data, file_path, dest_dir.string().c_str(), &copy_err)) {
        set_error(error, take_error(copy_err, "Volume copy failed"));
        musicdl_release_string(root);
        return MUSICDL_SYNC_ERROR;
    }
    musicdl_release_error(copy_err);

    if (volume_root) *volume_root = root;
    else musicdl_release_string(root);
    return MUSICDL_SYNC_COPIED;
}

};
